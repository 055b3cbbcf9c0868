#include <catch2/catch.hpp>
#include <stencil/log.hpp>
#include "test_support.hpp"
#include <cstdio>
#include <functional>
#include <string>
#include <vector>
#include <unistd.h>

using namespace stencil::log;

// Capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    if (pipe(pipefd) != 0) return "";
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    Level saved = get_level();
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(saved);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold reach stderr", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("this is a warning");
        error("this is an error");
    });
    REQUIRE(output.find("warn: this is a warning\n") != std::string::npos);
    REQUIRE(output.find("error: this is an error\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("registry '%s' priority %d", "corp", 3);
    });
    REQUIRE(output == "info: registry 'corp' priority 3\n");
}

TEST_CASE("Sink receives records instead of stderr", "[log]") {
    set_color_enabled(false);
    std::string output;
    {
        LogCapture capture(Debug);
        output = capture_stderr([] {
            debug("trying registry '%s'", "local");
            trace("below the threshold");
        });

        auto records = capture.records();
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].first == Debug);
        REQUIRE(records[0].second == "trying registry 'local'");
    }
    REQUIRE(output.empty());
}

TEST_CASE("Clearing the sink restores stderr output", "[log]") {
    set_level(Info);
    set_color_enabled(false);
    {
        LogCapture capture(Info);
    }
    auto output = capture_stderr([] {
        info("back on stderr");
    });
    REQUIRE(output.find("back on stderr") != std::string::npos);
}

TEST_CASE("A sink may log and replace itself", "[log]") {
    set_level(Info);
    std::vector<std::string> seen;
    set_sink([&seen](Level, const std::string& msg) {
        seen.push_back(msg);
        is_color_enabled();
        if (seen.size() == 1) {
            info("nested %d", 2);
            set_sink([&seen](Level, const std::string& m) { seen.push_back("replaced: " + m); });
        }
    });

    info("outer");
    info("after");
    set_sink({});

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0] == "outer");
    REQUIRE(seen[1] == "nested 2");
    REQUIRE(seen[2] == "replaced: after");
}
