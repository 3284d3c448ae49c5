#include "host_source.h"

#include <curl/curl.h>
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <utility>

#include "exceptions.h"

namespace chkcert
{
    namespace
    {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        size_t AppendToString(char* data, size_t size, size_t nmemb, void* userp)
        {
            auto* body = static_cast<std::string*>(userp);
            body->append(data, size * nmemb);
            return size * nmemb;
        }

        std::string UrlEncode(CURL* curl, const std::string& value)
        {
            char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
            if (escaped == nullptr) throw BackendException("failed to URL-encode request parameter");
            std::string out(escaped);
            curl_free(escaped);
            return out;
        }

        std::string RequireCredential(const Config& config, const char* key)
        {
            std::string value = config.GetString(key);
            if (value.empty()) throw ConfigException(std::string(key) + " not set!");
            return value;
        }
    } // namespace

    std::vector<std::string> ReadHostList(std::istream& is)
    {
        static constexpr std::string_view empty_strs = " \t\r\n";
        std::vector<std::string> hosts;
        std::string line;
        while (std::getline(is, line))
        {
            size_t begin_index = line.find_first_not_of(empty_strs);
            if (begin_index == std::string::npos) continue;
            size_t end_index = line.find_last_not_of(empty_strs);
            hosts.emplace_back(line, begin_index, end_index - begin_index + 1);
        }
        return hosts;
    }

    std::vector<std::string> ReadHostFile(const std::string& path)
    {
        std::ifstream ifs(path);
        if (!ifs.is_open()) throw ConfigException("Can't open input file: '" + path + "'");
        return ReadHostList(ifs);
    }

    std::vector<std::string> ParseHostListJson(const std::string& body, const std::string& key)
    {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream iss(body);
        if (!Json::parseFromStream(builder, iss, &root, &errors))
            throw BackendException("response is not valid JSON: " + errors);
        if (!root.isObject() || !root.isMember(key))
            throw BackendException("response has no '" + key + "' member");
        const Json::Value& list = root[key];
        if (!list.isArray())
            throw BackendException("'" + key + "' is not an array");

        std::vector<std::string> hosts;
        hosts.reserve(list.size());
        for (Json::ArrayIndex i = 0; i < list.size(); i++)
        {
            if (!list[i].isString())
                throw BackendException("'" + key + "' item " + std::to_string(i) + " is not a string");
            hosts.push_back(list[i].asString());
        }
        return hosts;
    }

    PastebinBackend::PastebinBackend(const Config& config, Logger logger)
        : user_key_(RequireCredential(config, Config::kPastebinUserKey)),
          dev_key_(RequireCredential(config, Config::kPastebinDevKey)),
          paste_id_(RequireCredential(config, Config::kPastebinPasteId)),
          logger_(std::move(logger))
    {
    }

    std::string PastebinBackend::RequestBody() const
    {
        CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) throw BackendException("failed to initialize curl");
        return "api_option=show_paste&api_user_key=" + UrlEncode(curl.get(), user_key_) +
               "&api_dev_key=" + UrlEncode(curl.get(), dev_key_) +
               "&api_paste_key=" + UrlEncode(curl.get(), paste_id_);
    }

    void PastebinBackend::Fetch(std::vector<std::string>& destination)
    {
        CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) throw BackendException("failed to initialize curl");

        const std::string payload = RequestBody();
        std::string body;
        curl_easy_setopt(curl.get(), CURLOPT_URL, kApiEndpoint);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        logger_->info("Fetching host list from {}", kApiEndpoint);
        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            throw BackendException(std::string("pastebin request failed: ") + curl_easy_strerror(res));

        long response_code = 0;
        if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK)
            throw BackendException("pastebin response code unavailable");
        if (response_code != 200)
            throw BackendException("pastebin answered HTTP " + std::to_string(response_code) + ": " + body);

        std::vector<std::string> hosts = ParseHostListJson(body, kDatasetKey);
        logger_->info("Fetched {} hosts from pastebin", hosts.size());
        destination.insert(destination.end(), hosts.begin(), hosts.end());
    }

    BackendRegistry BackendRegistry::WithDefaults()
    {
        BackendRegistry registry;
        registry.Register("pastebin", [](const Config& config, Logger logger) -> std::unique_ptr<HostListBackend>
                          {
                              return std::make_unique<PastebinBackend>(config, std::move(logger));
                          });
        return registry;
    }

    void BackendRegistry::Register(const std::string& name, Factory factory)
    {
        factories_[name] = std::move(factory);
    }

    bool BackendRegistry::Contains(const std::string& name) const
    {
        return factories_.find(name) != factories_.end();
    }

    std::vector<std::string> BackendRegistry::Names() const
    {
        std::vector<std::string> names;
        for (const auto& kv : factories_)
            names.push_back(kv.first);
        return names;
    }

    std::unique_ptr<HostListBackend> BackendRegistry::Create(const std::string& name, const Config& config,
                                                             Logger logger) const
    {
        auto it = factories_.find(name);
        if (it == factories_.end())
        {
            std::string known;
            for (const auto& kv : factories_)
                known += (known.empty() ? "" : ", ") + kv.first;
            throw ConfigException("Unknown backend '" + name + "', available: " + known);
        }
        return it->second(config, std::move(logger));
    }
} // namespace chkcert
