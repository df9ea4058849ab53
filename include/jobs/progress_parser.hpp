#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ProgressSample {
    uint64_t transferredBytes{0};
    double percentage{0.0};
    std::optional<double> speedBytesPerSec;
    std::optional<int64_t> etaSeconds;
};

struct ParsedLine {
    enum class Kind {
        NONE,
        LOG,
        PROGRESS
    };

    Kind kind{Kind::NONE};
    std::string message;        // the trimmed line for LOG and PROGRESS
    ProgressSample progress;    // valid for PROGRESS only
};

// Stateless recognizer for rsync and rclone output lines. Never throws.
class ProgressParser {
public:
    static ParsedLine parse(const std::string& line);

    // "16,384", "1.23M", "1.234 MiB", "512 B". Units with an 'i' are binary, others decimal.
    static std::optional<uint64_t> parseSize(const std::string& text);
    // "4.00MB/s", "1.0 MiB/s", "11.43kB/s"
    static std::optional<double> parseSpeed(const std::string& text);
    // "0:00:05", "1:05", "8s", "1h2m3s", "-"
    static std::optional<int64_t> parseEta(const std::string& text);

    // File name carried by an rsync itemize line or an rclone transfer notice,
    // or the bare line when it looks like a path. Empty for summary and status lines.
    static std::optional<std::string> extractCurrentFile(const std::string& line);

    static double clampPercentage(double value);
};

// Splits raw output chunks into lines on '\n' and '\r'. A trailing partial
// line is held until its terminator arrives or flush() is called at EOF.
class LineBuffer {
public:
    explicit LineBuffer(size_t maxLineLength = 64 * 1024);

    std::vector<std::string> append(const std::string& chunk);
    std::optional<std::string> flush();
    bool hasPending() const { return !pending_.empty(); }

private:
    std::string pending_;
    size_t maxLineLength_;
};
