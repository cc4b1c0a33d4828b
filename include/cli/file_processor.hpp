#pragma once

#include "engine/redaction_engine.hpp"
#include "screen/binary_screener.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace biip {

inline constexpr std::string_view kPasteSeparator = "──────────";

/**
 * @brief What happened to one file argument
 */
struct FileOutcome {
    enum class Status { REDACTED, BINARY, OVERSIZED, FAILED };

    std::string path;
    Status status = Status::FAILED;
    std::string output;           // redacted content (REDACTED only)
    std::string error_message;    // FAILED only
    size_t size = 0;
    RedactionReport report;
};

/**
 * @brief File-argument driver
 *
 * Reads, screens and redacts files on a pool of workers; outcomes are
 * always returned and written in argument order.
 */
class FileProcessor {
public:
    struct Options {
        size_t max_file_size = 10 * 1024 * 1024;
        size_t jobs = 0;                      // 0 = hardware concurrency
        bool header = true;
        BinaryScreener::Config binary;
    };

    /**
     * @param engine Must outlive the processor
     */
    FileProcessor(const RedactionEngine& engine, Options options);

    [[nodiscard]] FileOutcome process_one(const std::string& path) const;

    [[nodiscard]] std::vector<FileOutcome> process(const std::vector<std::string>& paths) const;

    /**
     * @brief Print outcomes: headers and content to out, warnings to err
     * @return true when every file was read
     */
    bool write(const std::vector<FileOutcome>& outcomes, std::ostream& out,
               std::ostream& err) const;

    /**
     * @brief Worker count actually used for n files
     */
    [[nodiscard]] size_t worker_count(size_t n) const;

private:
    const RedactionEngine& engine_;
    Options options_;
    BinaryScreener screener_;
};

/**
 * @brief Piped input: redact line by line as lines arrive
 *
 * The first sample is screened; binary input is copied through unchanged.
 * Every output line ends with '\n'.
 *
 * @return Redaction counts for the whole stream
 */
RedactionReport redact_stream(std::istream& in, std::ostream& out,
                              const RedactionEngine& engine, const BinaryScreener& screener);

/**
 * @brief Interactive terminal: prompt, read to EOF, redact once
 */
RedactionReport redact_paste(std::istream& in, std::ostream& out, std::ostream& err,
                             const RedactionEngine& engine, const BinaryScreener& screener);

} // namespace biip
