#include "exercise/exercise_catalog.hpp"

#include <algorithm>
#include <fstream>

#include "exercise/exercise_codec.hpp"
#include "utils/logging.hpp"

#include "nlohmann/json.hpp"

namespace gradebox::exercise {

ExerciseCatalog::ExerciseCatalog(std::vector<Exercise> exercises) {
    for (auto& exercise : exercises) {
        Add(std::move(exercise));
    }
}

std::size_t ExerciseCatalog::LoadDirectory(const std::filesystem::path& root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        utils::LogWarn("catalog", "exercises directory not found: " + root.string());
        return 0;
    }
    const auto before = exercises_.size();
    LoadDirectoryRecursive(root);
    const auto loaded = exercises_.size() - before;
    utils::LogInfo("catalog", "loaded " + std::to_string(loaded) + " exercises from " + root.string());
    return loaded;
}

void ExerciseCatalog::LoadDirectoryRecursive(const std::filesystem::path& dir) {
    std::error_code ec;
    std::vector<std::filesystem::path> entries;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        utils::LogWarn("catalog", "failed to list " + dir.string() + ": " + ec.message());
        return;
    }
    std::sort(entries.begin(), entries.end());
    for (const auto& path : entries) {
        if (std::filesystem::is_directory(path, ec)) {
            LoadDirectoryRecursive(path);
        } else if (path.extension() == ".json") {
            LoadFile(path);
        }
    }
}

bool ExerciseCatalog::LoadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        utils::LogWarn("catalog", "cannot open " + path.string());
        return false;
    }
    auto data = nlohmann::json::parse(input, nullptr, false);
    if (data.is_discarded()) {
        utils::LogError("catalog", "invalid JSON in " + path.filename().string());
        return false;
    }
    auto parsed = ParseExercise(data);
    if (!parsed.Ok()) {
        utils::LogError("catalog", "invalid exercise in " + path.filename().string() + ": " +
                        DescribeErrors(parsed.errors));
        return false;
    }
    if (exercises_.count(parsed.value->id) > 0) {
        utils::LogWarn("catalog", "duplicate exercise id '" + parsed.value->id + "' in " +
                       path.filename().string() + ", replacing earlier definition");
    }
    Add(std::move(*parsed.value));
    return true;
}

void ExerciseCatalog::Add(Exercise exercise) {
    auto id = exercise.id;
    exercises_[std::move(id)] = std::move(exercise);
}

const Exercise* ExerciseCatalog::Find(const std::string& id) const {
    auto it = exercises_.find(id);
    if (it == exercises_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> ExerciseCatalog::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(exercises_.size());
    for (const auto& [id, _] : exercises_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace gradebox::exercise
