#include "row_reader/artifact_writer.hpp"
#include "row_reader/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace rr {

bool write_run_json(const std::string& artifact_root,
                    const std::string& slug,
                    const std::string& run_json_str,
                    std::string* path_out,
                    std::string* err_out) {
  const std::filesystem::path out =
      std::filesystem::path(artifact_root) / slug / "run.json";

  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "failed to create " + out.parent_path().string();
    return false;
  }
  std::ofstream rj(out, std::ios::binary);
  if (!rj) {
    if (err_out) *err_out = "failed to open " + out.string();
    return false;
  }
  rj.write(run_json_str.data(),
           static_cast<std::streamsize>(run_json_str.size()));
  if (!rj) {
    if (err_out) *err_out = "failed to write " + out.string();
    return false;
  }
  if (path_out) *path_out = out.string();
  return true;
}

}
