#include "package_source.hpp"

#include "dpkg_source.hpp"
#include "lpkg_source.hpp"

MemoryPackageSource::MemoryPackageSource(std::vector<PackageRecord> records)
    : records_(std::move(records)) {}

std::vector<PackageRecord> MemoryPackageSource::load_installed() {
    return records_;
}

std::unique_ptr<PackageSource> make_package_source(Backend backend, bool with_files) {
    switch (backend) {
        case Backend::LPKG:
            return std::make_unique<LpkgDbSource>();
        case Backend::DPKG:
        default:
            return std::make_unique<DpkgStatusSource>(DPKG_STATUS_FILE, DPKG_INFO_DIR, get_architecture(), with_files);
    }
}

void apply_size_hook(std::vector<PackageRecord>& records, const SizeHook& hook) {
    if (!hook) return;
    for (auto& record : records) {
        record.own_size += hook(record.installed_files);
    }
}
