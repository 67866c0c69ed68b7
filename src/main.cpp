// main.cpp
#include "api/teldrive_api.hpp"
#include "driver/driver_config.hpp"
#include "driver/teldrive_driver.hpp"
#include "http/http_transport.hpp"
#include "logger/Mylogger.hpp"
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace
{
    teldrive::CancellationToken cancelToken;

    // Signal handler for graceful shutdown
    void signal_handler(int)
    {
        cancelToken.cancel();
    }

    void usage(const char *prog)
    {
        std::cout << "Usage: " << prog << " <config.json> <command> [args]\n"
                  << "Commands:\n"
                  << "  put <local-file> <remote-dir>   upload (resumes an interrupted upload)\n"
                  << "  ls <remote-dir>                 list a directory\n"
                  << "  mkdir <remote-parent> <name>    create a folder\n"
                  << "  link <remote-dir> <name>        print the download URL of a file\n";
    }

    teldrive::StorageObject dirObject(const std::string &path)
    {
        teldrive::StorageObject dir;
        dir.isFolder = true;
        dir.path = path.empty() ? "/" : path;
        return dir;
    }

    teldrive::TimePoint modTimeOf(const std::string &path)
    {
        struct stat st;
        if (stat(path.c_str(), &st) != 0)
        {
            return std::chrono::system_clock::now();
        }
        return std::chrono::system_clock::from_time_t(st.st_mtime);
    }

    int runPut(teldrive::TelDriveDriver &driver, const std::string &localPath, const std::string &remoteDir)
    {
        std::ifstream in(localPath, std::ios::binary);
        if (!in)
        {
            std::cerr << "Cannot open " << localPath << std::endl;
            return EXIT_FAILURE;
        }

        teldrive::FileStream file;
        file.name = fs::path(localPath).filename().string();
        file.size = static_cast<int64_t>(fs::file_size(localPath));
        file.modTime = modTimeOf(localPath);
        file.in = &in;

        auto progress = [](double percent)
        {
            std::printf("\rUploading: %6.2f%%", percent);
            std::fflush(stdout);
        };
        teldrive::StorageObject obj = driver.put(dirObject(remoteDir), file, progress, &cancelToken);
        std::cout << "\nUploaded " << obj.path << " (id " << obj.id << ", " << obj.size << " bytes)" << std::endl;
        return EXIT_SUCCESS;
    }

    int runList(teldrive::TelDriveDriver &driver, const std::string &remoteDir)
    {
        for (const auto &obj : driver.list(dirObject(remoteDir)))
        {
            std::cout << (obj.isFolder ? "d " : "- ") << obj.size << "\t" << teldrive::formatTime(obj.modTime)
                      << "\t" << obj.path << "\n";
        }
        return EXIT_SUCCESS;
    }

    int runLink(teldrive::TelDriveDriver &driver, const std::string &remoteDir, const std::string &name)
    {
        for (const auto &obj : driver.list(dirObject(remoteDir)))
        {
            if (obj.name == name)
            {
                std::cout << driver.link(obj).url << std::endl;
                return EXIT_SUCCESS;
            }
        }
        std::cerr << "No such file: " << name << std::endl;
        return EXIT_FAILURE;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);  // Ctrl+C
    std::signal(SIGTERM, signal_handler);

    try
    {
        teldrive::DriverConfig config = teldrive::DriverConfig::fromFile(argv[1]);
        if (!MyLogger::setLevel(config.logLevel))
        {
            MyLogger::warning("Unknown log_level '" + config.logLevel + "', keeping info");
        }

        teldrive::ApiSettings settings;
        settings.apiHost = config.apiHost;
        settings.uploadHost = config.uploadHost;
        settings.accessToken = config.accessToken;

        auto api = std::make_shared<teldrive::TelDriveApi>(settings, std::make_shared<teldrive::CurlTransport>());
        teldrive::TelDriveDriver driver(config, api);
        driver.init();

        const std::string command = argv[2];
        if (command == "put" && argc == 5)
            return runPut(driver, argv[3], argv[4]);
        if (command == "ls" && argc == 4)
            return runList(driver, argv[3]);
        if (command == "mkdir" && argc == 5)
        {
            teldrive::StorageObject obj = driver.makeDir(dirObject(argv[3]), argv[4]);
            std::cout << "Created " << obj.path << " (id " << obj.id << ")" << std::endl;
            return EXIT_SUCCESS;
        }
        if (command == "link" && argc == 5)
            return runLink(driver, argv[3], argv[4]);

        usage(argv[0]);
        return EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n!!! Error: " << e.what() << " !!!\n";
        return EXIT_FAILURE;
    }
}
