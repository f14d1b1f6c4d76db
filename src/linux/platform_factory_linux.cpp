#include "../platform_factory.hpp"

#include "linux_process_source.hpp"
#include "linux_system_data_provider.hpp"

namespace procpeek {

std::unique_ptr<IProcessSource> make_process_source() {
    return std::make_unique<LinuxProcessSource>();
}

std::unique_ptr<IProcessSource> make_details_source() {
    // Separate instance so the UI thread never shares reader state with the collector.
    return std::make_unique<LinuxProcessSource>();
}

std::unique_ptr<ISystemDataProvider> make_system_data_provider() {
    return std::make_unique<LinuxSystemDataProvider>();
}

} // namespace procpeek
