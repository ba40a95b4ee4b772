#pragma once

#include "domain/domain_model.hpp"

namespace pgnkit::app {

// Port/interface for reading/writing move-tree options.
// Implementations live in infra (e.g. JSON file).
class ITreeConfigRepository {
public:
    virtual ~ITreeConfigRepository() = default;

    virtual pgnkit::domain::TreeOptions load() const = 0;
    virtual bool save(const pgnkit::domain::TreeOptions& options) const = 0;
};

} // namespace pgnkit::app
