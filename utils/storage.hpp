//
// storage.hpp - Run directory allocation under root/project/group
//

#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <string>

enum class StorageMode {
    ITERATE,
    OVERWRITE
};

// "iterate" or "overwrite", anything else throws InvalidModeError
StorageMode parse_storage_mode(const std::string& mode);

// Creates root and root/project, then the run folder root/project/group/run_name.
//
// ITERATE: if that folder already exists, root/project/group_0, group_1, ...
// are probed until one is free. The suffix goes on the group and the run
// name is dropped from the path; existing result trees depend on that layout.
// OVERWRITE: the exact folder is created or reused.
//
// Returns the folder that was created.
std::string create_storage_folder(const std::string& main_folder_path,
                                  const std::string& project_folder,
                                  const std::string& group_folder,
                                  const std::string& run_name,
                                  StorageMode mode = StorageMode::ITERATE);

std::string create_storage_folder(const std::string& main_folder_path,
                                  const std::string& project_folder,
                                  const std::string& group_folder,
                                  const std::string& run_name,
                                  const std::string& mode);

#endif //STORAGE_HPP
