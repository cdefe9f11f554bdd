#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace jsonpatch_cpp;

namespace {

struct Captured {
    log::Level level;
    std::string file;
    int line;
    std::string message;
};

// Routes log records into a vector for the lifetime of a test.
class LogCapture : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = log::level();
        log::set_sink([this](const log::Record& r) {
            records_.push_back(Captured{r.level, std::string{r.file}, r.line, std::string{r.message}});
        });
    }

    void TearDown() override {
        log::set_sink({});
        log::set_level(saved_level_);
    }

    std::vector<Captured> records_;
    log::Level saved_level_{log::Level::warning};
};

}  // namespace

TEST(LogLevel, to_string_view_covers_all_variants) {
    EXPECT_EQ(log::to_string_view(log::Level::off),     "OFF");
    EXPECT_EQ(log::to_string_view(log::Level::error),   "ERROR");
    EXPECT_EQ(log::to_string_view(log::Level::warning), "WARNING");
    EXPECT_EQ(log::to_string_view(log::Level::info),    "INFO");
    EXPECT_EQ(log::to_string_view(log::Level::debug),   "DEBUG");
}

TEST_F(LogCapture, default_level_is_warning) {
    EXPECT_EQ(log::level(), log::Level::warning);
    EXPECT_TRUE(log::enabled(log::Level::error));
    EXPECT_TRUE(log::enabled(log::Level::warning));
    EXPECT_FALSE(log::enabled(log::Level::info));
    EXPECT_FALSE(log::enabled(log::Level::off));
}

TEST_F(LogCapture, macros_format_and_filter) {
    log::set_level(log::Level::info);
    JSONPATCH_CPP_LOG_ERROR("e {}", 1);
    JSONPATCH_CPP_LOG_WARN("w {}", "two");
    JSONPATCH_CPP_LOG_INFO("i {}/{}", 3, 4);
    JSONPATCH_CPP_LOG_DEBUG("hidden {}", 5);

    ASSERT_EQ(records_.size(), 3u);
    EXPECT_EQ(records_[0].level, log::Level::error);
    EXPECT_EQ(records_[0].message, "e 1");
    EXPECT_EQ(records_[1].level, log::Level::warning);
    EXPECT_EQ(records_[1].message, "w two");
    EXPECT_EQ(records_[2].message, "i 3/4");
    EXPECT_GT(records_[2].line, 0);
    EXPECT_NE(records_[2].file.find("log_test.cpp"), std::string::npos);
}

TEST_F(LogCapture, off_silences_everything) {
    log::set_level(log::Level::off);
    JSONPATCH_CPP_LOG_ERROR("nothing");
    EXPECT_TRUE(records_.empty());
}

TEST_F(LogCapture, lenient_skip_is_logged_at_debug) {
    log::set_level(log::Level::debug);
    auto doc = Value::parse(R"({"a": 1})");
    Patch{PatchOptions{.strict_path_exists = false}}.apply(
        doc, parse_operations(R"([{"op": "remove", "path": "/missing"}])"));

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log::Level::debug);
    EXPECT_EQ(records_[0].message,
              "operation 0 skipped: remove /missing: path member not exists: missing");
}

TEST_F(LogCapture, failure_is_logged_at_info) {
    log::set_level(log::Level::info);
    auto doc = Value::parse(R"({"a": 1})");
    EXPECT_THROW(Patch{}.apply(doc, parse_operations(R"([{"op": "remove", "path": "/missing"}])")),
                 Exception);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log::Level::info);
}

TEST_F(LogCapture, successful_patch_is_silent) {
    log::set_level(log::Level::debug);
    auto doc = Value::parse(R"({"a": 1})");
    Patch{}.apply(doc, parse_operations(R"([{"op": "replace", "path": "/a", "value": 2}])"));
    EXPECT_TRUE(records_.empty());
}

TEST_F(LogCapture, disabled_level_does_not_evaluate_arguments) {
    log::set_level(log::Level::warning);
    auto calls = 0;
    auto count = [&calls] { return ++calls; };
    JSONPATCH_CPP_LOG_DEBUG("{}", count());
    JSONPATCH_CPP_LOG_INFO("{}", count());
    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(records_.empty());

    JSONPATCH_CPP_LOG_WARN("{}", count());
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "1");
}

TEST_F(LogCapture, sink_may_log_from_inside_itself) {
    log::set_level(log::Level::info);
    auto nested = false;
    log::set_sink([this, &nested](const log::Record& r) {
        records_.push_back(Captured{r.level, std::string{r.file}, r.line, std::string{r.message}});
        if (!nested) {
            nested = true;
            JSONPATCH_CPP_LOG_INFO("inner {}", 2);
        }
    });

    JSONPATCH_CPP_LOG_WARN("outer {}", 1);

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].message, "outer 1");
    EXPECT_EQ(records_[1].message, "inner 2");
}

TEST_F(LogCapture, sink_may_replace_itself) {
    log::set_level(log::Level::info);
    auto first = 0;
    auto second = 0;
    log::set_sink([&first, &second](const log::Record&) {
        ++first;
        log::set_sink([&second](const log::Record&) { ++second; });
    });

    JSONPATCH_CPP_LOG_INFO("a");
    JSONPATCH_CPP_LOG_INFO("b");
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}
