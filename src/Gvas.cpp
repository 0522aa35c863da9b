#include "Gvas.h"
#include <fstream>
#include <algorithm>
#include <iostream>
#include <cstdio>

GVASFile::GVASFile() : m_loaded(false) {
}

GVASFile::~GVASFile() {
    close();
}

bool GVASFile::load(const std::string& path) {
    close();

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        std::cout << "[SAV] Cannot open " << path << std::endl;
        return false;
    }

    std::streamoff size = file.tellg();
    if (size <= 0) {
        std::cout << "[SAV] Empty or unreadable file: " << path << std::endl;
        return false;
    }
    file.seekg(0);

    m_data.resize(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(m_data.data()), size);
    if (!file) {
        std::cout << "[SAV] Short read on " << path << std::endl;
        close();
        return false;
    }

    m_path = path;
    m_loaded = true;
    std::cout << "[SAV] Loaded " << path << " (" << m_data.size() << " bytes)" << std::endl;
    return true;
}

bool GVASFile::load(const std::vector<uint8_t>& data) {
    close();
    if (data.empty()) return false;
    m_data = data;
    m_loaded = true;
    return true;
}

bool GVASFile::save(const std::string& path) {
    if (!m_loaded) return false;
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) return false;
    f.write(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    if (!f.good()) return false;
    std::cout << "[SAV] Wrote " << m_data.size() << " bytes to " << path << std::endl;
    return true;
}

void GVASFile::close() {
    m_data.clear();
    m_path.clear();
    m_loaded = false;
}

size_t GVASFile::find(const char* pattern, size_t patternLen, size_t from) const {
    if (patternLen == 0 || from >= m_data.size()) return std::string::npos;
    auto it = std::search(m_data.begin() + from, m_data.end(), pattern, pattern + patternLen);
    if (it == m_data.end()) return std::string::npos;
    return static_cast<size_t>(it - m_data.begin());
}

uint32_t GVASFile::readUInt32At(size_t pos) const {
    if (!canRead(pos, 4)) return 0;
    return static_cast<uint32_t>(m_data[pos]) |
           (static_cast<uint32_t>(m_data[pos + 1]) << 8) |
           (static_cast<uint32_t>(m_data[pos + 2]) << 16) |
           (static_cast<uint32_t>(m_data[pos + 3]) << 24);
}

bool GVASFile::writeUInt32At(size_t pos, uint32_t val) {
    if (!canRead(pos, 4)) return false;
    m_data[pos] = static_cast<uint8_t>(val & 0xFF);
    m_data[pos + 1] = static_cast<uint8_t>((val >> 8) & 0xFF);
    m_data[pos + 2] = static_cast<uint8_t>((val >> 16) & 0xFF);
    m_data[pos + 3] = static_cast<uint8_t>((val >> 24) & 0xFF);
    return true;
}

// The name is the NUL-terminated string ending just before the 4-byte length
// prefix of the type string. Walk back from its last byte to the preceding NUL.
bool GVASFile::readNameBefore(size_t typePos, std::string& name) const {
    if (typePos < static_cast<size_t>(GVAS_NAME_BACKTRACK)) return false;
    size_t nameEnd = typePos - GVAS_NAME_BACKTRACK + 1;
    size_t pos = nameEnd - 1;
    while (pos > 0 && m_data[pos] != 0) pos--;
    if (m_data[pos] != 0) return false;
    size_t nameStart = pos + 1;
    if (nameStart >= nameEnd) return false;
    name.assign(reinterpret_cast<const char*>(&m_data[nameStart]), nameEnd - nameStart);
    return true;
}

std::vector<IntProperty> GVASFile::scanIntProperties() const {
    std::vector<IntProperty> results;
    size_t i = 0;
    while (i < m_data.size()) {
        size_t start = find(GVAS_INT_PROPERTY, GVAS_INT_PROPERTY_LEN, i);
        if (start == std::string::npos) break;
        i = start + 1;

        std::string name;
        if (!readNameBefore(start, name)) continue;

        size_t lenPos = start + GVAS_INT_PROPERTY_LEN + 1;
        if (!canRead(lenPos, 4)) {
            std::cout << "[SCAN] Truncated record for " << name << " at " << start << std::endl;
            continue;
        }
        uint64_t dataLength = readUInt32At(lenPos);
        uint64_t valuePos = static_cast<uint64_t>(lenPos) + 4 + dataLength + 1;
        if (valuePos > m_data.size() || !canRead(static_cast<size_t>(valuePos), 4)) {
            std::cout << "[SCAN] Error unpacking value at position " << valuePos
                      << ": not enough data" << std::endl;
            continue;
        }

        IntProperty prop;
        prop.name = name;
        prop.offset = static_cast<size_t>(valuePos);
        prop.value = readUInt32At(prop.offset);
        results.push_back(prop);
    }
    std::cout << "[SCAN] Found " << results.size() << " IntProperty records" << std::endl;
    return results;
}

bool GVASFile::createBackup(const std::string& savPath, const std::string& backupDir) {
    std::error_code ec;
    if (!fs::exists(savPath, ec)) return false;
    std::string backupPath = getBackupPath(savPath, backupDir);
    if (fs::exists(backupPath, ec)) return true;
    fs::create_directories(backupDir, ec);
    if (ec) {
        std::cout << "[SAV] Cannot create backup dir " << backupDir << ": " << ec.message() << std::endl;
        return false;
    }
    fs::copy_file(savPath, backupPath, ec);
    if (ec) {
        std::cout << "[SAV] Backup of " << savPath << " failed: " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[SAV] Backup written to " << backupPath << std::endl;
    return true;
}

bool GVASFile::restoreBackup(const std::string& savPath, const std::string& backupDir) {
    std::error_code ec;
    std::string backupPath = getBackupPath(savPath, backupDir);
    if (!fs::exists(backupPath, ec)) return false;
    fs::copy_file(backupPath, savPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::cout << "[SAV] Restore of " << savPath << " failed: " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[SAV] Restored " << savPath << " from " << backupPath << std::endl;
    return true;
}

bool GVASFile::backupExists(const std::string& savPath, const std::string& backupDir) {
    std::error_code ec;
    return fs::exists(getBackupPath(savPath, backupDir), ec);
}

// FNV-1a over the absolute parent directory, so equally named saves from
// different folders never share a backup.
static uint32_t hashDirectory(const std::string& savPath) {
    std::error_code ec;
    fs::path dir = fs::absolute(fs::path(savPath), ec).parent_path();
    if (ec) dir = fs::path(savPath).parent_path();
    std::string key = dir.lexically_normal().generic_string();
    uint32_t hash = 2166136261u;
    for (char c : key) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

std::string GVASFile::getBackupPath(const std::string& savPath, const std::string& backupDir) {
    std::string filename = fs::path(savPath).filename().string();
    char dirTag[9];
    snprintf(dirTag, sizeof(dirTag), "%08X", hashDirectory(savPath));
    return (fs::path(backupDir) / (filename + "." + dirTag + ".backup")).string();
}
