// include/beacon/ping.hpp
// Built ping artifact handed to storage.

#pragma once

#include <string>

namespace beacon {

// An inert, serialized ping. The core never looks inside; storage persists it
// and the client later uploads payload to upload_path.
struct Ping {
    std::string type;
    std::string document_id;
    std::string upload_path;
    std::string payload;
};

} // namespace beacon
