#include "config.h"

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace chkcert
{
    namespace
    {
        constexpr std::string_view kBlank = " \t\r\n";

        std::string Trim(std::string_view sv)
        {
            size_t begin_index = sv.find_first_not_of(kBlank);
            if (begin_index == std::string_view::npos) return std::string();
            size_t end_index = sv.find_last_not_of(kBlank);
            return std::string(sv.substr(begin_index, end_index - begin_index + 1));
        }

        std::string Unquote(const std::string& value)
        {
            if (value.size() >= 2)
            {
                char first = value.front();
                if ((first == '"' || first == '\'') && value.back() == first)
                    return value.substr(1, value.size() - 2);
            }
            return value;
        }
    } // namespace

    Config::Config()
        : values_(),
          use_environment_(true)
    {
    }

    bool Config::LoadFile(const std::string& path)
    {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        Load(ifs);
        return true;
    }

    void Config::Load(std::istream& is)
    {
        static constexpr std::string_view export_prefix = "export ";
        std::string line;
        while (std::getline(is, line))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed.front() == '#') continue;
            std::string_view sv(trimmed);
            if (sv.substr(0, export_prefix.size()) == export_prefix)
                sv.remove_prefix(export_prefix.size());
            size_t eq = sv.find('=');
            if (eq == std::string_view::npos) continue;
            std::string key = Trim(sv.substr(0, eq));
            if (key.empty()) continue;
            values_[key] = Unquote(Trim(sv.substr(eq + 1)));
        }
    }

    std::string Config::GetString(const std::string& key, const std::string& default_value) const
    {
        if (use_environment_)
        {
            const char* env = std::getenv(key.c_str());
            if (env != nullptr && *env != '\0') return std::string(env);
        }
        auto it = values_.find(key);
        if (it != values_.end() && !it->second.empty()) return it->second;
        return default_value;
    }

    bool Config::Has(const std::string& key) const
    {
        return !GetString(key).empty();
    }

    void Config::Set(const std::string& key, const std::string& value)
    {
        values_[key] = value;
    }

    void Config::SetUseEnvironment(bool use_environment)
    {
        use_environment_ = use_environment;
    }
} // namespace chkcert
