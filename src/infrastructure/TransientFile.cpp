#include "infrastructure/TransientFile.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <uuid/uuid.h>

namespace voicescribe::infrastructure {

namespace fs = std::filesystem;

std::string TransientFile::GenerateId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char buffer[37];
    uuid_unparse_lower(uuid, buffer);
    return std::string(buffer);
}

TransientFile::TransientFile(const std::string& suffix, const fs::path& directory) {
    fs::path base = directory.empty() ? fs::temp_directory_path() : directory;
    m_path = base / ("voicescribe_" + GenerateId() + suffix);
}

TransientFile::~TransientFile() {
    release();
}

void TransientFile::write(const std::string& bytes) const {
    std::ofstream ofs(m_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open transient file: " + m_path.string());
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (ofs.fail()) {
        throw std::runtime_error("Write failed for transient file: " + m_path.string());
    }
}

std::string TransientFile::read() const {
    std::ifstream ifs(m_path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Transient file not found: " + m_path.string());
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

void TransientFile::release() noexcept {
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[TransientFile] Could not remove " << m_path.string() << ": " << ec.message() << std::endl;
    }
}

} // namespace voicescribe::infrastructure
