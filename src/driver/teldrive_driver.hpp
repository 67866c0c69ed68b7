#pragma once

#include <memory>
#include "driver_config.hpp"
#include "storage_driver.hpp"
#include "../api/teldrive_api.hpp"

namespace teldrive
{
    class TelDriveDriver : public StorageDriver
    {
    public:
        TelDriveDriver(DriverConfig config, std::shared_ptr<TelDriveApi> api);

        // Resolves the session; must run before put() so uploads are keyed to
        // the right owner.
        void init();

        StorageObject root() const override;
        std::vector<StorageObject> list(const StorageObject &dir) override;
        StorageObject makeDir(const StorageObject &parent, const std::string &name) override;
        StorageObject put(const StorageObject &dir, FileStream &file,
                          const ProgressCallback &progress,
                          const CancellationToken *cancel) override;
        void remove(const StorageObject &obj) override;
        StorageObject rename(const StorageObject &obj, const std::string &newName) override;
        StorageObject move(const StorageObject &obj, const StorageObject &dstDir) override;
        Link link(const StorageObject &file) override;

        UploadOptions uploadOptions() const;

    private:
        DriverConfig config_;
        std::shared_ptr<TelDriveApi> api_;
    };
}
