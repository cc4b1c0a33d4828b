#include "cli/file_processor.hpp"
#include "cli/input_reader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <iostream>
#include <iterator>
#include <thread>

namespace biip {

namespace {

void write_terminated(std::ostream& out, std::string_view text) {
    out << text;
    if (!text.empty() && text.back() != '\n') out << '\n';
}

} // anonymous namespace

FileProcessor::FileProcessor(const RedactionEngine& engine, Options options)
    : engine_(engine),
      options_(std::move(options)),
      screener_(options_.binary) {}

size_t FileProcessor::worker_count(size_t n) const {
    if (n == 0) return 0;
    size_t workers = options_.jobs;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::min(workers, n);
}

FileOutcome FileProcessor::process_one(const std::string& path) const {
    FileOutcome outcome;
    outcome.path = path;

    Result<std::string> contents = Result<std::string>::ok({});
    if (path == "-") {
        contents = Result<std::string>::ok(read_all(std::cin));
    } else {
        const auto size = regular_file_size(path);
        if (size.is_error()) {
            outcome.error_message = size.error_message();
            return outcome;
        }
        if (size.value() > options_.max_file_size) {
            outcome.status = FileOutcome::Status::OVERSIZED;
            outcome.size = size.value();
            return outcome;
        }
        contents = read_file(path);
    }

    if (contents.is_error()) {
        outcome.error_message = contents.error_message();
        return outcome;
    }

    const std::string& text = contents.value();
    outcome.size = text.size();

    // Size of a FIFO or stdin is only known after reading
    if (text.size() > options_.max_file_size) {
        outcome.status = FileOutcome::Status::OVERSIZED;
        return outcome;
    }
    if (screener_.is_binary(text)) {
        outcome.status = FileOutcome::Status::BINARY;
        return outcome;
    }

    utils::Timer timer;
    outcome.output = engine_.redact(text, outcome.report);
    outcome.status = FileOutcome::Status::REDACTED;
    utils::log::debug(std::format("{}: {} bytes, {} redactions in {}us",
        path, text.size(), outcome.report.total(), timer.elapsed_us().count()));
    return outcome;
}

std::vector<FileOutcome> FileProcessor::process(const std::vector<std::string>& paths) const {
    std::vector<FileOutcome> outcomes(paths.size());
    const size_t num_files = paths.size();
    const size_t num_workers = worker_count(num_files);

    // Each worker fills its own slots, so argument order is preserved
    auto process_range = [&](size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            outcomes[i] = process_one(paths[i]);
        }
    };

    if (num_workers > 1) {
        const size_t chunk = (num_files + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_files);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, process_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        process_range(0, num_files);
    }

    return outcomes;
}

bool FileProcessor::write(const std::vector<FileOutcome>& outcomes, std::ostream& out,
                          std::ostream& err) const {
    bool all_read = true;
    RedactionReport totals;

    for (const auto& o : outcomes) {
        switch (o.status) {
            case FileOutcome::Status::REDACTED:
                if (options_.header) {
                    out << std::format("─── {} ───\n", o.path);
                }
                write_terminated(out, o.output);
                totals.merge(o.report);
                break;
            case FileOutcome::Status::BINARY:
                err << std::format("warning: binary file skipped: {}\n", o.path);
                break;
            case FileOutcome::Status::OVERSIZED:
                err << std::format("warning: file too large, skipped: {} ({} bytes > {})\n",
                                   o.path, o.size, options_.max_file_size);
                break;
            case FileOutcome::Status::FAILED:
                err << std::format("error: {}\n", o.error_message);
                all_read = false;
                break;
        }
    }
    out.flush();

    utils::log::info(std::format("{} file(s), {} redactions", outcomes.size(), totals.total()));
    return all_read;
}

RedactionReport redact_stream(std::istream& in, std::ostream& out,
                              const RedactionEngine& engine, const BinaryScreener& screener) {
    RedactionReport report;

    std::string pending(screener.config().sample_size, '\0');
    in.read(pending.data(), static_cast<std::streamsize>(pending.size()));
    pending.resize(static_cast<size_t>(in.gcount()));

    if (screener.is_binary(pending)) {
        utils::log::warn("binary input on stdin, passing through unchanged");
        out << pending;
        std::copy(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>(),
                  std::ostreambuf_iterator<char>(out));
        out.flush();
        return report;
    }

    auto emit = [&](std::string_view line) {
        out << engine.redact(line, report) << '\n';
        out.flush();
    };

    // Complete lines inside the screened sample
    size_t pos = 0;
    for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', pos)) {
        emit(std::string_view(pending).substr(pos, nl - pos));
        pos = nl + 1;
    }
    std::string partial = pending.substr(pos);

    std::string line;
    while (std::getline(in, line)) {
        if (!partial.empty()) {
            line.insert(0, partial);
            partial.clear();
        }
        emit(line);
    }
    if (!partial.empty()) emit(partial);

    return report;
}

RedactionReport redact_paste(std::istream& in, std::ostream& out, std::ostream& err,
                             const RedactionEngine& engine, const BinaryScreener& screener) {
    RedactionReport report;

    err << "Paste content. Press Ctrl-D to finish:\n" << kPasteSeparator << '\n';
    err.flush();
    const std::string text = read_all(in);
    err << kPasteSeparator << '\n';
    err.flush();

    if (screener.is_binary(text)) {
        out << text;
    } else {
        write_terminated(out, engine.redact(text, report));
    }
    out.flush();
    return report;
}

} // namespace biip
