#pragma once

#include "interfaces/i_process_source.hpp"
#include "interfaces/i_system_data_provider.hpp"
#include <memory>

namespace procpeek {

// Factory functions to create platform-specific providers.
// Implemented per-platform; non-Linux builds get the stub providers.
std::unique_ptr<IProcessSource> make_process_source();
std::unique_ptr<IProcessSource> make_details_source(); // separate instance for the UI thread
std::unique_ptr<ISystemDataProvider> make_system_data_provider();

} // namespace procpeek
