/**
 * @file log_test.cpp
 * @brief Log level filtering, callback sink, status strings
 */

#include "ftbench/log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#define CHECK(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL [%s:%d]: %s\n", __FILE__, __LINE__, msg); \
        exit(1); \
    } \
} while(0)

static int         g_calls = 0;
static ft_log_level g_last_level = FT_LOG_TRACE;
static std::string g_last_component;
static std::string g_last_message;

static void capture(ft_log_level level, const char* component,
                    const char* message, void* userdata) {
    ++g_calls;
    g_last_level = level;
    g_last_component = component;
    g_last_message = message;
    if (userdata) ++*static_cast<int*>(userdata);
}

int main() {
    printf("=== Log Test ===\n");

    int ud_hits = 0;
    ft_log_set_callback(capture, &ud_hits);

    /* Default level is INFO */
    CHECK(ft_log_get_level() == FT_LOG_INFO, "default level info");
    ft_log(FT_LOG_DEBUG, "topo", "hidden %d", 1);
    CHECK(g_calls == 0, "debug filtered at info");

    ft_log(FT_LOG_WARN, "orchestrator", "%u unreachable", 3u);
    CHECK(g_calls == 1, "warn delivered");
    CHECK(g_last_level == FT_LOG_WARN, "level forwarded");
    CHECK(g_last_component == "orchestrator", "component forwarded");
    CHECK(g_last_message == "3 unreachable", "message formatted");
    CHECK(ud_hits == 1, "userdata forwarded");

    ft_log_set_level(FT_LOG_TRACE);
    ft_log(FT_LOG_TRACE, "proc", "spawned");
    CHECK(g_calls == 2, "trace delivered at trace level");

    ft_log_set_level(FT_LOG_OFF);
    ft_log(FT_LOG_FATAL, "cli", "silenced");
    CHECK(g_calls == 2, "everything filtered at off");

    /* Level names */
    ft_log_level lv = FT_LOG_INFO;
    CHECK(ft_log_level_parse("debug", &lv) && lv == FT_LOG_DEBUG, "parse debug");
    CHECK(ft_log_level_parse("off", &lv) && lv == FT_LOG_OFF, "parse off");
    CHECK(!ft_log_level_parse("verbose", &lv) && lv == FT_LOG_OFF, "unknown name rejected");

    /* Status strings */
    CHECK(std::strcmp(ft_status_str(FT_OK), "ok") == 0, "ok string");
    CHECK(std::strcmp(ft_status_str(FT_ERROR_MALFORMED_GRAPH),
                      "malformed topology graph") == 0, "malformed string");
    CHECK(std::strcmp(ft_status_str(FT_ERROR_UNREACHABLE), "hosts unreachable") == 0,
          "unreachable string");

    /* Level changes race with logging from another thread */
    {
        ft_log_set_level(FT_LOG_INFO);
        int before = g_calls;
        std::thread toggler([] {
            for (int i = 0; i < 10000; ++i)
                ft_log_set_level((i & 1) ? FT_LOG_OFF : FT_LOG_WARN);
            ft_log_set_level(FT_LOG_WARN);
        });
        for (int i = 0; i < 10000; ++i)
            ft_log(FT_LOG_ERROR, "proc", "tick %d", i);
        toggler.join();
        CHECK(ft_log_get_level() == FT_LOG_WARN, "last level wins");
        CHECK(g_calls >= before && g_calls <= before + 10000, "calls bounded");
        ft_log(FT_LOG_ERROR, "proc", "after");
        CHECK(g_last_message == "after", "delivered once level settled");
    }

    ft_log_set_callback(nullptr, nullptr);
    ft_log_set_level(FT_LOG_INFO);

    printf("PASS: all log tests passed\n");
    return 0;
}
