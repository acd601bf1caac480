#pragma once
#include <string>

namespace rr {

// Writes <artifact_root>/<slug>/run.json, creating directories as needed.
// On success `path_out` (if given) receives the file path.
bool write_run_json(const std::string& artifact_root,
                    const std::string& slug,
                    const std::string& run_json_str,
                    std::string* path_out = nullptr,
                    std::string* err_out = nullptr);

}
