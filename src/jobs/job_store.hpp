#pragma once

#include "jobs/job_types.hpp"

namespace playrun::jobs {

class JobStore {
public:
    virtual ~JobStore() = default;

    virtual UnifiedJob Get(int id) = 0;
    virtual UnifiedJob UpdateModel(int id, const ModelUpdate& update) = 0;
};

}  // namespace playrun::jobs
