#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "exercise/exercise_types.hpp"

namespace gradebox::exercise {

// Read-only view of the exercise content collaborator. Loaded once at
// startup; lookups afterwards are safe from any number of threads.
class ExerciseCatalog {
public:
    ExerciseCatalog() = default;
    explicit ExerciseCatalog(std::vector<Exercise> exercises);

    // Loads every *.json file below root, recursively. Invalid files are
    // logged and skipped. Returns the number of exercises loaded.
    std::size_t LoadDirectory(const std::filesystem::path& root);
    bool LoadFile(const std::filesystem::path& path);

    void Add(Exercise exercise);
    const Exercise* Find(const std::string& id) const;
    std::size_t Size() const { return exercises_.size(); }
    std::vector<std::string> Ids() const;

private:
    void LoadDirectoryRecursive(const std::filesystem::path& dir);

    std::unordered_map<std::string, Exercise> exercises_;
};

}  // namespace gradebox::exercise
