#include "jobs/progress_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::optional<double> parseNumber(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c != ',') {
            digits += c;
        }
    }
    if (digits.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(digits, &consumed);
        if (consumed != digits.size() || !std::isfinite(value) || value < 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// rsync --info=progress2 / --progress:
//   "  1,234,567  45%  1.23MB/s  0:00:12 (xfr#3, to-chk=10/20)"
const std::regex& rsyncProgressRegex() {
    static const std::regex re(
        R"(^\s*([\d,]+(?:\.\d+)?[KMGTP]?)\s+(\d+)%\s+([\d.,]+[kKMGTP]?B/s)\s+(\d+:\d{2}(?::\d{2})?))");
    return re;
}

// rclone --stats-one-line:
//   "Transferred:   1.234 MiB / 10 MiB, 12%, 1.0 MiB/s, ETA 8s"
const std::regex& rcloneStatsRegex() {
    static const std::regex re(
        R"(([\d.]+\s*[kKMGTP]?i?B)\s*/\s*([\d.]+\s*[kKMGTP]?i?B),\s*(-|\d+(?:\.\d+)?)%,\s*([\d.]+\s*[kKMGTP]?i?B/s),\s*ETA\s*(\S+))");
    return re;
}

// "50% 10MB/s eta 30s"
const std::regex& genericProgressRegex() {
    static const std::regex re(
        R"((\d+(?:\.\d+)?)%\s+([\d.]+\s*[kKMGTP]?i?B/s)\s+eta\s+(\S+))",
        std::regex::icase);
    return re;
}

// rsync --itemize-changes, e.g. ">f+++++++++ docs/readme.md" or "cd+++++++++ docs/"
const std::regex& itemizeRegex() {
    static const std::regex re(R"(^[<>ch.*][fdLDS][.+?a-zA-Z]{9,10}\s+(.+)$)");
    return re;
}

const std::regex& rcloneCopiedRegex() {
    static const std::regex re(R"(INFO\s*:\s*(.+?):\s*(?:Copied|Updated|Deleted|Moved))");
    return re;
}

bool isSummaryLine(const std::string& line) {
    static const char* const prefixes[] = {
        "sending", "receiving", "total", "sent ", "Number of", "Total ",
        "Literal data", "Matched data", "File list", "rsync:", "rsync error",
        "building file list", "created directory", "deleting ", "Transferred:",
        "Checks:", "Elapsed time:", "Errors:", "ERROR", "NOTICE", "DEBUG"
    };
    for (const char* prefix : prefixes) {
        if (startsWith(line, prefix)) {
            return true;
        }
    }
    return line.find("files to consider") != std::string::npos;
}

// Values at or past these bounds do not fit the result types.
const double ETA_LIMIT = static_cast<double>(std::numeric_limits<int64_t>::max());
const double SIZE_LIMIT = static_cast<double>(std::numeric_limits<uint64_t>::max());

std::optional<int64_t> toEtaSeconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds >= ETA_LIMIT) {
        return std::nullopt;
    }
    return static_cast<int64_t>(seconds);
}

} // namespace

double ProgressParser::clampPercentage(double value) {
    if (!std::isfinite(value) || value < 0.0) {
        return 0.0;
    }
    return std::min(value, 100.0);
}

std::optional<uint64_t> ProgressParser::parseSize(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    size_t unitStart = value.size();
    while (unitStart > 0 && std::isalpha(static_cast<unsigned char>(value[unitStart - 1]))) {
        --unitStart;
    }
    std::string unit = value.substr(unitStart);
    auto number = parseNumber(trim(value.substr(0, unitStart)));
    if (!number) {
        return std::nullopt;
    }

    bool binary = unit.find('i') != std::string::npos;
    double base = binary ? 1024.0 : 1000.0;
    double multiplier = 1.0;
    if (!unit.empty()) {
        switch (std::toupper(static_cast<unsigned char>(unit[0]))) {
            case 'B': multiplier = 1.0; break;
            case 'K': multiplier = base; break;
            case 'M': multiplier = base * base; break;
            case 'G': multiplier = base * base * base; break;
            case 'T': multiplier = base * base * base * base; break;
            case 'P': multiplier = base * base * base * base * base; break;
            default:
                return std::nullopt;
        }
    }
    double bytes = std::round(*number * multiplier);
    if (!std::isfinite(bytes) || bytes >= SIZE_LIMIT) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

std::optional<double> ProgressParser::parseSpeed(const std::string& text) {
    std::string value = trim(text);
    const std::string suffix = "/s";
    if (value.size() <= suffix.size() || value.compare(value.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }
    auto bytes = parseSize(value.substr(0, value.size() - suffix.size()));
    if (!bytes) {
        return std::nullopt;
    }
    return static_cast<double>(*bytes);
}

std::optional<int64_t> ProgressParser::parseEta(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value == "-" || value[0] == '-') {
        return std::nullopt;
    }

    if (value.find(':') != std::string::npos) {
        std::vector<double> parts;
        size_t start = 0;
        while (start <= value.size()) {
            size_t colon = value.find(':', start);
            std::string part = value.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
            if (part.empty() || !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return std::nullopt;
            }
            auto amount = parseNumber(part);
            if (!amount) {
                return std::nullopt;
            }
            parts.push_back(*amount);
            if (colon == std::string::npos) {
                break;
            }
            start = colon + 1;
        }
        if (parts.size() == 2) {
            return toEtaSeconds(parts[0] * 60 + parts[1]);
        }
        if (parts.size() == 3) {
            return toEtaSeconds(parts[0] * 3600 + parts[1] * 60 + parts[2]);
        }
        return std::nullopt;
    }

    // rclone duration: "1d2h3m4s", "8s", "1.5s"
    double total = 0.0;
    std::string number;
    bool sawUnit = false;
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            number += c;
            continue;
        }
        if (number.empty()) {
            return std::nullopt;
        }
        auto amount = parseNumber(number);
        if (!amount) {
            return std::nullopt;
        }
        switch (c) {
            case 'd': total += std::floor(*amount * 86400); break;
            case 'h': total += std::floor(*amount * 3600); break;
            case 'm': total += std::floor(*amount * 60); break;
            case 's': total += std::floor(*amount); break;
            default:
                return std::nullopt;
        }
        number.clear();
        sawUnit = true;
    }
    if (!number.empty() || !sawUnit) {
        return std::nullopt;
    }
    return toEtaSeconds(total);
}

ParsedLine ProgressParser::parse(const std::string& line) {
    ParsedLine result;
    std::string text = trim(line);
    if (text.empty()) {
        return result;
    }
    result.message = text;

    try {
        std::smatch match;
        if (std::regex_search(text, match, rsyncProgressRegex())) {
            auto transferred = parseSize(match[1].str());
            auto percent = parseNumber(match[2].str());
            if (transferred && percent) {
                result.kind = ParsedLine::Kind::PROGRESS;
                result.progress.transferredBytes = *transferred;
                result.progress.percentage = clampPercentage(*percent);
                result.progress.speedBytesPerSec = parseSpeed(match[3].str());
                result.progress.etaSeconds = parseEta(match[4].str());
                return result;
            }
        }

        if (std::regex_search(text, match, rcloneStatsRegex())) {
            auto transferred = parseSize(match[1].str());
            if (transferred) {
                auto percent = parseNumber(match[3].str());
                result.kind = ParsedLine::Kind::PROGRESS;
                result.progress.transferredBytes = *transferred;
                result.progress.percentage = clampPercentage(percent.value_or(0.0));
                result.progress.speedBytesPerSec = parseSpeed(match[4].str());
                result.progress.etaSeconds = parseEta(match[5].str());
                return result;
            }
        }

        if (std::regex_search(text, match, genericProgressRegex())) {
            auto percent = parseNumber(match[1].str());
            if (percent) {
                result.kind = ParsedLine::Kind::PROGRESS;
                result.progress.percentage = clampPercentage(*percent);
                result.progress.speedBytesPerSec = parseSpeed(match[2].str());
                result.progress.etaSeconds = parseEta(match[3].str());
                return result;
            }
        }
    } catch (const std::exception&) {
        // std::regex can throw on pathological input; fall through to LOG.
    }

    result.kind = ParsedLine::Kind::LOG;
    return result;
}

std::optional<std::string> ProgressParser::extractCurrentFile(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    try {
        std::smatch match;
        if (std::regex_match(text, match, itemizeRegex())) {
            std::string path = trim(match[1].str());
            // Symlink itemize lines read "name -> target"
            size_t arrow = path.find(" -> ");
            if (arrow != std::string::npos) {
                path = path.substr(0, arrow);
            }
            return path.empty() ? std::nullopt : std::optional<std::string>(path);
        }
        if (std::regex_search(text, match, rcloneCopiedRegex())) {
            return trim(match[1].str());
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (isSummaryLine(text) || text.back() == ':') {
        return std::nullopt;
    }
    if (parse(text).kind == ParsedLine::Kind::PROGRESS) {
        return std::nullopt;
    }
    return text;
}

LineBuffer::LineBuffer(size_t maxLineLength)
    : maxLineLength_(maxLineLength == 0 ? 1 : maxLineLength) {
}

std::vector<std::string> LineBuffer::append(const std::string& chunk) {
    std::vector<std::string> lines;
    for (char c : chunk) {
        if (c == '\n' || c == '\r') {
            // "\r\n" and rsync's repeated '\r' redraws produce empty segments; skip them.
            if (!pending_.empty()) {
                lines.push_back(pending_);
                pending_.clear();
            }
            continue;
        }
        pending_ += c;
        if (pending_.size() >= maxLineLength_) {
            lines.push_back(pending_);
            pending_.clear();
        }
    }
    return lines;
}

std::optional<std::string> LineBuffer::flush() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string line = pending_;
    pending_.clear();
    return line;
}
