//
// storage.cpp - Run directory allocation
//

#include "storage.hpp"
#include "errors.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

StorageMode parse_storage_mode(const std::string& mode) {
    if (mode == "iterate") {
        return StorageMode::ITERATE;
    }
    if (mode == "overwrite") {
        return StorageMode::OVERWRITE;
    }
    throw InvalidModeError("Invalid storage mode '" + mode + "'. Use 'iterate' or 'overwrite'.");
}

std::string create_storage_folder(const std::string& main_folder_path,
                                  const std::string& project_folder,
                                  const std::string& group_folder,
                                  const std::string& run_name,
                                  StorageMode mode) {
    fs::create_directories(main_folder_path);
    fs::path project_path = fs::path(main_folder_path) / project_folder;
    fs::create_directories(project_path);

    fs::path save_path = project_path / group_folder / run_name;

    switch (mode) {
        case StorageMode::ITERATE: {
            size_t counter = 0;
            while (fs::exists(save_path)) {
                save_path = project_path / (group_folder + "_" + std::to_string(counter));
                ++counter;
            }
            fs::create_directories(save_path);
            break;
        }
        case StorageMode::OVERWRITE:
            fs::create_directories(save_path);
            break;
    }

    std::cout << "Storage folder: " << save_path.string() << std::endl;
    return save_path.string();
}

std::string create_storage_folder(const std::string& main_folder_path,
                                  const std::string& project_folder,
                                  const std::string& group_folder,
                                  const std::string& run_name,
                                  const std::string& mode) {
    // Reject the mode before any directory is touched
    StorageMode parsed = parse_storage_mode(mode);
    return create_storage_folder(main_folder_path, project_folder, group_folder, run_name, parsed);
}
