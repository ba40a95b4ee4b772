#pragma once

#include <string>

#include "domain/domain_model.hpp"
#include "app/ITreeConfigRepository.hpp"

namespace pgnkit::infra {

class TreeConfigRepository : public pgnkit::app::ITreeConfigRepository {
public:
    explicit TreeConfigRepository(std::string path);

    // Load options from JSON file.
    // If the file is missing or invalid, returns default options and logs a
    // warning. Keys that are absent keep their default value.
    pgnkit::domain::TreeOptions load() const override;

    // Returns false (and logs) if the file cannot be written.
    bool save(const pgnkit::domain::TreeOptions& options) const override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace pgnkit::infra
