#ifndef __HOST_SOURCE_H__
#define __HOST_SOURCE_H__

#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "logger.h"

namespace chkcert
{
    // One host per line; blank lines are dropped, order is kept.
    std::vector<std::string> ReadHostList(std::istream& is);

    // Throws ConfigException when the file can't be opened.
    std::vector<std::string> ReadHostFile(const std::string& path);

    // Hostname strings from the array stored under key in a JSON object.
    // Throws BackendException on malformed documents.
    std::vector<std::string> ParseHostListJson(const std::string& body, const std::string& key);

    // A remote source of the host list.
    class HostListBackend
    {
    public:
        virtual ~HostListBackend() = default;
        // Appends the fetched hosts to destination. Throws BackendException.
        virtual void Fetch(std::vector<std::string>& destination) = 0;
    };

    // Reads {"check_ssl": [...]} from a private paste through the raw paste API.
    class PastebinBackend : public HostListBackend
    {
    public:
        static constexpr const char* kApiEndpoint = "https://pastebin.com/api/api_raw.php";
        static constexpr const char* kDatasetKey = "check_ssl";

        // Throws ConfigException if any credential is missing.
        PastebinBackend(const Config& config, Logger logger);

        void Fetch(std::vector<std::string>& destination) override;

        // Form body of the show_paste request, values URL-encoded.
        std::string RequestBody() const;

    protected:
        std::string user_key_;
        std::string dev_key_;
        std::string paste_id_;
        Logger logger_;
    };

    class BackendRegistry
    {
    public:
        using Factory = std::function<std::unique_ptr<HostListBackend>(const Config&, Logger)>;

        // Registry with every built-in backend.
        static BackendRegistry WithDefaults();

        void Register(const std::string& name, Factory factory);
        bool Contains(const std::string& name) const;
        std::vector<std::string> Names() const;

        // Throws ConfigException for an unknown name.
        std::unique_ptr<HostListBackend> Create(const std::string& name, const Config& config, Logger logger) const;

    protected:
        std::map<std::string, Factory> factories_;
    };
} // namespace chkcert

#endif
