#ifndef __CHKCERT_CONFIG_H__
#define __CHKCERT_CONFIG_H__

#include <istream>
#include <map>
#include <string>

namespace chkcert
{
    // Key/value settings taken from a KEY=VALUE file and the process
    // environment. The environment wins over the file.
    class Config
    {
    public:
        static constexpr const char* kPrometheusExportFilename = "PROMETHEUS_EXPORT_FILENAME";
        static constexpr const char* kPastebinUserKey = "PASTEBIN_USERKEY";
        static constexpr const char* kPastebinDevKey = "PASTEBIN_DEVKEY";
        static constexpr const char* kPastebinPasteId = "PASTEBIN_PASTEID";
        static constexpr const char* kLogLevel = "LOG_LEVEL";

        Config();

        // Returns false when the file does not exist; that is not an error.
        bool LoadFile(const std::string& path);
        void Load(std::istream& is);

        std::string GetString(const std::string& key, const std::string& default_value = "") const;
        bool Has(const std::string& key) const;
        void Set(const std::string& key, const std::string& value);

        // Drops process environment lookups; used by tests.
        void SetUseEnvironment(bool use_environment);

    protected:
        std::map<std::string, std::string> values_;
        bool use_environment_;
    };
} // namespace chkcert

#endif
