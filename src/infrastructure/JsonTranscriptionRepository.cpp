/**
 * @file JsonTranscriptionRepository.cpp
 * @brief Implementation of JsonTranscriptionRepository.
 */

#include "infrastructure/JsonTranscriptionRepository.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace voicescribe::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json ToJson(const domain::TranscriptionRecord& record) {
    json j = {
        {"id", record.id},
        {"text", record.text},
        {"source", domain::TranscriptionRecord::SourceToString(record.source)},
        {"createdAt", record.createdAt}
    };
    if (record.fileName) j["fileName"] = *record.fileName;
    if (record.duration) j["duration"] = *record.duration;
    return j;
}

std::optional<domain::TranscriptionRecord> FromJson(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        domain::TranscriptionRecord record;
        record.id = j.at("id").get<std::string>();
        record.text = j.at("text").get<std::string>();
        record.createdAt = j.at("createdAt").get<std::string>();
        auto source = domain::TranscriptionRecord::SourceFromString(j.value("source", "file"));
        if (!source) return std::nullopt;
        record.source = *source;
        if (j.contains("fileName") && j["fileName"].is_string()) {
            record.fileName = j["fileName"].get<std::string>();
        }
        if (j.contains("duration") && j["duration"].is_number()) {
            record.duration = j["duration"].get<double>();
        }
        return record;
    } catch (const json::exception& e) {
        std::cerr << "[JsonTranscriptionRepository] Skipping malformed record: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

JsonTranscriptionRepository::JsonTranscriptionRepository(const fs::path& filePath)
    : m_filePath(filePath) {
    load();
}

std::string JsonTranscriptionRepository::GenerateId() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, static_cast<int>(sizeof(alphabet)) - 2);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string id = std::to_string(ms) + "-";
    for (int i = 0; i < 9; ++i) {
        id += alphabet[pick(rng)];
    }
    return id;
}

std::string JsonTranscriptionRepository::CurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(now));
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

void JsonTranscriptionRepository::load() {
    if (!fs::exists(m_filePath)) {
        return;
    }
    try {
        std::ifstream f(m_filePath);
        json j;
        f >> j;
        if (!j.is_array()) {
            std::cerr << "[JsonTranscriptionRepository] " << m_filePath.string() << " is not an array; starting empty" << std::endl;
            return;
        }
        for (const auto& item : j) {
            if (auto record = FromJson(item)) {
                m_records.push_back(std::move(*record));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[JsonTranscriptionRepository] Failed to load transcriptions: " << e.what() << std::endl;
    }
}

void JsonTranscriptionRepository::persist() const {
    json j = json::array();
    for (const auto& record : m_records) {
        j.push_back(ToJson(record));
    }

    if (m_filePath.has_parent_path()) {
        fs::create_directories(m_filePath.parent_path());
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = m_filePath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << j.dump(2);
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, m_filePath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("Failed to save transcriptions: " + ec.message());
    }
}

std::optional<domain::TranscriptionRecord> JsonTranscriptionRepository::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(),
                           [&id](const auto& r) { return r.id == id; });
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<domain::TranscriptionRecord> JsonTranscriptionRepository::list() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

domain::TranscriptionRecord JsonTranscriptionRepository::create(const domain::NewTranscription& data) {
    domain::TranscriptionRecord record;
    record.id = GenerateId();
    record.text = data.text;
    record.source = data.source;
    record.fileName = data.fileName;
    record.duration = data.duration;
    record.createdAt = CurrentTimestamp();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.insert(m_records.begin(), record);
    try {
        persist();
    } catch (const std::exception&) {
        m_records.erase(m_records.begin());
        throw;
    }
    return record;
}

bool JsonTranscriptionRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(),
                           [&id](const auto& r) { return r.id == id; });
    if (it == m_records.end()) {
        return false;
    }
    domain::TranscriptionRecord removed = *it;
    auto position = m_records.erase(it);
    try {
        persist();
    } catch (const std::exception&) {
        m_records.insert(position, std::move(removed));
        throw;
    }
    return true;
}

} // namespace voicescribe::infrastructure
