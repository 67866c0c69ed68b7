#include "teldrive_driver.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include "../upload/upload_identity.hpp"

namespace teldrive
{
    namespace
    {
        std::string parentOf(const std::string &path)
        {
            auto slash = path.find_last_of('/');
            if (slash == std::string::npos || slash == 0)
                return "";
            return path.substr(0, slash);
        }
    }

    TelDriveDriver::TelDriveDriver(DriverConfig config, std::shared_ptr<TelDriveApi> api)
        : config_(std::move(config)), api_(std::move(api))
    {
        if (!api_)
        {
            throw std::invalid_argument("TelDriveDriver needs an API client");
        }
    }

    void TelDriveDriver::init()
    {
        api_->initialize();
    }

    UploadOptions TelDriveDriver::uploadOptions() const
    {
        UploadOptions options;
        options.chunkSize = config_.chunkSizeBytes();
        options.randomChunkName = config_.randomChunkName;
        options.encryptFiles = config_.encryptFiles;
        options.channelId = config_.channelId;
        options.concurrency = config_.uploadConcurrency;
        return options;
    }

    StorageObject TelDriveDriver::root() const
    {
        StorageObject obj;
        obj.id = "root";
        obj.isFolder = true;
        obj.path = "/";
        obj.modTime = std::chrono::system_clock::now();
        return obj;
    }

    std::vector<StorageObject> TelDriveDriver::list(const StorageObject &dir)
    {
        std::string path = normalizeDirPath(dir.path);
        std::vector<StorageObject> objects;
        for (const auto &info : api_->listFiles(path))
        {
            StorageObject obj;
            obj.id = info.id;
            obj.name = info.name;
            obj.size = info.size;
            obj.modTime = info.modTime;
            obj.isFolder = info.type == "folder";
            obj.path = joinPath(path, info.name);
            obj.parentId = info.parentId;
            objects.push_back(obj);
        }
        MyLogger::debug("Listed " + std::to_string(objects.size()) + " entries under " + dir.path);
        return objects;
    }

    StorageObject TelDriveDriver::makeDir(const StorageObject &parent, const std::string &name)
    {
        std::string newPath = joinPath(parent.path, name);
        FileInfo info = api_->createFolder(newPath);

        StorageObject obj;
        obj.id = info.id;
        obj.name = name;
        obj.modTime = info.modTime;
        obj.isFolder = true;
        obj.path = newPath;
        obj.parentId = info.parentId;
        MyLogger::info("Created folder " + newPath);
        return obj;
    }

    StorageObject TelDriveDriver::put(const StorageObject &dir, FileStream &file,
                                      const ProgressCallback &progress,
                                      const CancellationToken *cancel)
    {
        ChunkedUploader uploader(*api_, uploadOptions());
        return uploader.upload(dir.path, file, api_->userId(), progress, cancel);
    }

    void TelDriveDriver::remove(const StorageObject &obj)
    {
        api_->deleteFiles({obj.id});
        MyLogger::info("Removed " + obj.path);
    }

    StorageObject TelDriveDriver::rename(const StorageObject &obj, const std::string &newName)
    {
        api_->renameFile(obj.id, newName);
        StorageObject renamed = obj;
        renamed.name = newName;
        renamed.path = joinPath(parentOf(obj.path), newName);
        return renamed;
    }

    StorageObject TelDriveDriver::move(const StorageObject &obj, const StorageObject &dstDir)
    {
        api_->moveFiles({obj.id}, dstDir.id);
        StorageObject moved = obj;
        moved.parentId = dstDir.id;
        moved.path = joinPath(dstDir.path, obj.name);
        return moved;
    }

    Link TelDriveDriver::link(const StorageObject &file)
    {
        if (file.isFolder)
        {
            throw NotAFileError(file.path);
        }
        Link result;
        result.url = api_->downloadUrl(file.id);
        result.headers["User-Agent"] = api_->settings().userAgent;
        return result;
    }
}
