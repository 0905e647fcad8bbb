#include "event_extractor.h"
#include "logger.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool isBlank(const std::string& line) {
    for (unsigned char c : line) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

uint64_t tokenCount(const json& usage, const char* key) {
    auto it = usage.find(key);
    if (it == usage.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) return static_cast<uint64_t>(it->get<int64_t>());
    return 0;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string readFrom(const std::string& file_path, uint64_t offset) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + file_path);

    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!in) throw std::runtime_error("cannot seek to " + std::to_string(offset) + " in " + file_path);

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("read error in " + file_path);
    return data;
}

} // namespace

ExtractResult EventExtractor::extract(const std::string& file_path, uint64_t start_offset) const {
    ExtractResult result;
    result.newOffset = start_offset;

    uint64_t size = fs::file_size(file_path);
    if (size <= start_offset) {
        return result;
    }

    const std::string data = readFrom(file_path, start_offset);
    const SessionInfo session = inferSessionInfo(file_path);

    uint64_t consumed = 0;
    size_t line_start = 0;
    size_t line_number = 0;
    while (line_start < data.size()) {
        size_t newline = data.find('\n', line_start);
        if (newline == std::string::npos) {
            // Incomplete trailing line; re-read once the writer finishes it
            break;
        }

        std::string line = data.substr(line_start, newline - line_start);
        consumed += (newline - line_start) + 1;
        line_start = newline + 1;
        ++line_number;
        ++result.linesConsumed;

        if (isBlank(line)) continue;

        json record;
        try {
            record = json::parse(line);
        } catch (const json::parse_error& e) {
            ++result.parseErrors;
            logError("[EventExtractor] Skipping malformed line " + std::to_string(line_number)
                     + " after offset " + std::to_string(start_offset) + " in " + file_path
                     + ": " + e.what());
            continue;
        }

        try {
            auto event = toUsageEvent(record, session);
            if (event) result.events.push_back(std::move(*event));
        } catch (const std::exception& e) {
            ++result.parseErrors;
            logError("[EventExtractor] Skipping unusable record in " + file_path + ": " + e.what());
        }
    }

    result.newOffset = start_offset + consumed;
    return result;
}

SessionInfo EventExtractor::inferSessionInfo(const std::string& file_path) {
    SessionInfo info;
    fs::path path(file_path);

    std::string file_name = path.filename().string();
    const std::string ext = ".jsonl";
    if (file_name.size() > ext.size() &&
        file_name.compare(file_name.size() - ext.size(), ext.size(), ext) == 0) {
        file_name.erase(file_name.size() - ext.size());
    }
    info.sessionId = file_name.empty() ? "unknown" : file_name;

    std::vector<std::string> parts;
    for (const auto& part : path) {
        parts.push_back(part.string());
    }

    info.project = "unknown";
    for (size_t i = 0; i < parts.size(); ++i) {
        // The component after "projects" must be a directory, not the file itself
        if (parts[i] == "projects" && i + 2 < parts.size()) {
            info.project = urlDecode(parts[i + 1]);
            break;
        }
    }
    return info;
}

std::optional<UsageEvent> EventExtractor::toUsageEvent(const json& record, const SessionInfo& session) {
    if (!record.is_object()) return std::nullopt;

    auto type_it = record.find("type");
    if (type_it == record.end() || !type_it->is_string() || type_it->get<std::string>() != "assistant") {
        return std::nullopt;
    }

    auto message_it = record.find("message");
    if (message_it == record.end() || !message_it->is_object()) return std::nullopt;
    auto usage_it = message_it->find("usage");
    if (usage_it == message_it->end() || !usage_it->is_object()) return std::nullopt;

    auto ts_it = record.find("timestamp");
    if (ts_it == record.end() || !ts_it->is_string()) {
        throw std::runtime_error("assistant usage record without timestamp");
    }

    UsageEvent event;
    event.type = EventType::Assistant;
    event.timestamp = ts_it->get<std::string>();
    event.project = session.project;

    auto sid_it = record.find("sessionId");
    if (sid_it != record.end() && sid_it->is_string() && !sid_it->get<std::string>().empty()) {
        event.sessionId = sid_it->get<std::string>();
    } else {
        event.sessionId = session.sessionId;
    }

    auto model_it = record.find("model");
    if (model_it != record.end() && model_it->is_string()) {
        event.model = model_it->get<std::string>();
    } else {
        auto inner_model = message_it->find("model");
        if (inner_model != message_it->end() && inner_model->is_string()) {
            event.model = inner_model->get<std::string>();
        }
    }

    const json& usage = *usage_it;
    event.inputTokens = tokenCount(usage, "input_tokens");
    event.outputTokens = tokenCount(usage, "output_tokens");
    event.cacheCreationTokens = tokenCount(usage, "cache_creation_input_tokens");
    event.cacheReadTokens = tokenCount(usage, "cache_read_input_tokens");

    auto cost_it = record.find("costUSD");
    if (cost_it != record.end() && cost_it->is_number() && cost_it->get<double>() >= 0.0) {
        event.costUSD = cost_it->get<double>();
    }

    return event;
}

std::string EventExtractor::urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}
