#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// "IntProperty" as it appears in the type string of a GVAS property record.
constexpr const char* GVAS_INT_PROPERTY = "IntProperty";
constexpr size_t GVAS_INT_PROPERTY_LEN = 11;

// Distance from the type string back to the last byte of the property name:
// 4-byte type length prefix + the name's NUL terminator + 1.
constexpr int GVAS_NAME_BACKTRACK = 6;

struct IntProperty {
    std::string name;
    uint32_t value = 0;
    size_t offset = 0;
};

class GVASFile {
public:
    GVASFile();
    ~GVASFile();

    bool load(const std::string& path);
    bool load(const std::vector<uint8_t>& data);
    bool save(const std::string& path);
    void close();

    bool isLoaded() const { return m_loaded; }
    const std::string& path() const { return m_path; }
    size_t size() const { return m_data.size(); }
    const std::vector<uint8_t>& rawData() const { return m_data; }

    size_t find(const char* pattern, size_t patternLen, size_t from) const;

    std::vector<IntProperty> scanIntProperties() const;

    bool canRead(size_t pos, size_t count) const {
        return pos <= m_data.size() && m_data.size() - pos >= count;
    }

    // Little-endian regardless of host byte order.
    uint32_t readUInt32At(size_t pos) const;
    bool writeUInt32At(size_t pos, uint32_t val);

    static bool createBackup(const std::string& savPath, const std::string& backupDir);
    static bool restoreBackup(const std::string& savPath, const std::string& backupDir);
    static bool backupExists(const std::string& savPath, const std::string& backupDir);
    static std::string getBackupPath(const std::string& savPath, const std::string& backupDir);

private:
    bool readNameBefore(size_t typePos, std::string& name) const;

    std::vector<uint8_t> m_data;
    std::string m_path;
    bool m_loaded;
};
