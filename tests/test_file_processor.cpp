#include <catch2/catch_test_macros.hpp>
#include "cli/file_processor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace biip;

namespace fs = std::filesystem;

namespace {

// Per-test scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = fs::temp_directory_path() /
            ("biip_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& name, std::string_view contents) const {
        const auto p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        return p.string();
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

Context test_context() {
    return build_context({{"API_SECRET", "abcd1234"}}, std::nullopt, "alice", "/home/alice");
}

} // anonymous namespace

TEST_CASE("FileProcessor: outcomes per file", "[files]") {
    TempDir dir;
    const Context ctx = test_context();
    const RedactionEngine engine(ctx);

    FileProcessor::Options opts;
    opts.max_file_size = 64;
    const FileProcessor processor(engine, opts);

    SECTION("Text file redacted") {
        const auto path = dir.write("a.txt", "mail bob@example.com\n");
        const auto outcome = processor.process_one(path);
        CHECK(outcome.status == FileOutcome::Status::REDACTED);
        CHECK(outcome.output == "mail •••@•••\n");
        CHECK(outcome.report.count(Category::EMAIL) == 1);
    }

    SECTION("Binary file skipped") {
        const auto path = dir.write("b.bin", std::string("\x00\x00PNG", 5));
        CHECK(processor.process_one(path).status == FileOutcome::Status::BINARY);
    }

    SECTION("Oversized file skipped") {
        const auto path = dir.write("big.txt", std::string(65, 'x'));
        const auto outcome = processor.process_one(path);
        CHECK(outcome.status == FileOutcome::Status::OVERSIZED);
        CHECK(outcome.size == 65);
    }

    SECTION("Missing file and directory fail") {
        CHECK(processor.process_one((dir.path() / "nope").string()).status ==
              FileOutcome::Status::FAILED);
        const auto outcome = processor.process_one(dir.path().string());
        CHECK(outcome.status == FileOutcome::Status::FAILED);
        CHECK_FALSE(outcome.error_message.empty());
    }
}

TEST_CASE("FileProcessor: output in argument order", "[files]") {
    TempDir dir;
    const Context ctx = test_context();
    const RedactionEngine engine(ctx);

    std::vector<std::string> paths;
    for (int i = 0; i < 12; ++i) {
        paths.push_back(dir.write("f" + std::to_string(i) + ".txt",
                                  "file " + std::to_string(i) + " by alice"));
    }
    const auto bin = dir.write("x.bin", std::string("\0\0\0", 3));
    paths.insert(paths.begin() + 5, bin);

    FileProcessor::Options opts;
    opts.jobs = 4;
    const FileProcessor processor(engine, opts);
    CHECK(processor.worker_count(paths.size()) == 4);

    const auto outcomes = processor.process(paths);
    REQUIRE(outcomes.size() == paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        CHECK(outcomes[i].path == paths[i]);
    }

    std::ostringstream out;
    std::ostringstream err;
    CHECK(processor.write(outcomes, out, err));

    std::string expected;
    for (int i = 0; i < 12; ++i) {
        expected += "─── " + paths[i < 5 ? i : i + 1] + " ───\n";
        expected += "file " + std::to_string(i) + " by user\n";
    }
    CHECK(out.str() == expected);
    CHECK(err.str() == "warning: binary file skipped: " + bin + "\n");
}

TEST_CASE("FileProcessor: headers and failures", "[files]") {
    TempDir dir;
    const Context ctx = test_context();
    const RedactionEngine engine(ctx);

    SECTION("Header can be disabled") {
        FileProcessor::Options opts;
        opts.header = false;
        const FileProcessor processor(engine, opts);

        const auto path = dir.write("a.txt", "token=abcd1234");
        std::ostringstream out, err;
        CHECK(processor.write(processor.process({path}), out, err));
        CHECK(out.str() == "token=••••••••\n");
    }

    SECTION("Unreadable file makes the run fail but others still print") {
        const FileProcessor processor(engine, FileProcessor::Options{});
        const auto good = dir.write("ok.txt", "hello");
        const auto missing = (dir.path() / "missing.txt").string();

        std::ostringstream out, err;
        CHECK_FALSE(processor.write(processor.process({missing, good}), out, err));
        CHECK(out.str().find("hello") != std::string::npos);
        CHECK(err.str().find("error: ") == 0);
    }
}

TEST_CASE("Streams: piped and pasted input", "[files]") {
    const Context ctx = test_context();
    const RedactionEngine engine(ctx);
    const BinaryScreener screener;

    SECTION("Line by line, every line newline-terminated") {
        std::istringstream in("alice here\nsecret abcd1234\nlast line without newline");
        std::ostringstream out;
        const auto report = redact_stream(in, out, engine, screener);
        CHECK(out.str() == "user here\nsecret ••••••••\nlast line without newline\n");
        CHECK(report.total() == 2);
    }

    SECTION("Lines longer than the screening sample are joined correctly") {
        BinaryScreener::Config cfg;
        cfg.sample_size = 8;
        const BinaryScreener small(cfg);

        std::istringstream in("prefix bob@example.com suffix\nnext\n");
        std::ostringstream out;
        (void)redact_stream(in, out, engine, small);
        CHECK(out.str() == "prefix •••@••• suffix\nnext\n");
    }

    SECTION("Binary input passes through unchanged") {
        const std::string data("\x00\x01" "alice\x00", 8);
        std::istringstream in(data);
        std::ostringstream out;
        (void)redact_stream(in, out, engine, screener);
        CHECK(out.str() == data);
    }

    SECTION("Empty input produces no output") {
        std::istringstream in("");
        std::ostringstream out;
        (void)redact_stream(in, out, engine, screener);
        CHECK(out.str().empty());
    }

    SECTION("Paste mode redacts once and frames the prompt on stderr") {
        std::istringstream in("line one alice\nline two abcd1234\n");
        std::ostringstream out, err;
        (void)redact_paste(in, out, err, engine, screener);
        CHECK(out.str() == "line one user\nline two ••••••••\n");
        const std::string prompt = err.str();
        const auto first = prompt.find(kPasteSeparator);
        REQUIRE(first != std::string::npos);
        CHECK(prompt.find(kPasteSeparator, first + kPasteSeparator.size()) != std::string::npos);
        CHECK(prompt.find("alice") == std::string::npos);
    }
}
