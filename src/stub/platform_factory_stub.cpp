#include "../platform_factory.hpp"
#include "stub_providers.hpp"

namespace procpeek {

std::unique_ptr<IProcessSource> make_process_source() {
    return std::make_unique<StubProcessSource>();
}

std::unique_ptr<IProcessSource> make_details_source() {
    return std::make_unique<StubProcessSource>();
}

std::unique_ptr<ISystemDataProvider> make_system_data_provider() {
    return std::make_unique<StubSystemDataProvider>();
}

} // namespace procpeek
