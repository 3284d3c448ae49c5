#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include "app.h"
#include "cert_probe.h"
#include "cli.h"
#include "config.h"
#include "exceptions.h"
#include "logger.h"

namespace
{
    std::atomic_bool g_stop(false);

    void HandleStopSignal(int)
    {
        g_stop = true;
    }

    int Run(const chkcert::CliOptions& options)
    {
        chkcert::Config config;
        config.LoadFile(".config");
        chkcert::Logger logger = chkcert::MakeLogger(options.verbose, config.GetString(chkcert::Config::kLogLevel));

        std::signal(SIGINT, HandleStopSignal);
        std::signal(SIGTERM, HandleStopSignal);

        chkcert::TlsProber prober(logger);
        prober.SetConnectTimeout(std::chrono::seconds(options.timeout_secs));
        chkcert::CheckRunner runner(prober, config, logger);
        runner.SetStopFlag(&g_stop);
        return runner.Run(options, std::cout);
    }
} // namespace

int main(int argc, char** argv)
{
    std::string program = argc > 0 ? argv[0] : "check_certificates";
    try
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; i++)
            args.emplace_back(argv[i]);
        chkcert::CliOptions options = chkcert::ParseArguments(args);
        if (options.help)
        {
            chkcert::PrintHelp(std::cout, program);
            return 0;
        }
        if (options.version)
        {
            std::cout << "check_certificates v" << chkcert::kVersion << std::endl;
            return 0;
        }
        return Run(options);
    }
    catch (const chkcert::CertCheckException& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "ERROR: unexpected failure: " << e.what() << std::endl;
        return 2;
    }
}
