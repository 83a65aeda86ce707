#pragma once

#include <string>
#include <vector>
#include "task_schema.hpp"

class TaskRegistry {
public:
    // Replaces an existing task with the same canonical name.
    void add(TaskSpec spec);

    // Exact canonical-name lookup first, then a case-insensitive match
    // against canonical names and display values. nullptr when unknown.
    const TaskSpec* find(const std::string& name) const;

    const std::vector<TaskSpec>& tasks() const { return tasks_; }

    // Tasks that target `device`, in registration order.
    std::vector<const TaskSpec*> by_device(const std::string& device) const;

    // Distinct devices in registration order.
    std::vector<std::string> devices() const;

private:
    std::vector<TaskSpec> tasks_;
};

// DG4202_TOGGLE, DG4202_SET_WAVEFORM, DG4202_SET_SWEEP, EDUX1002A_AUTO.
TaskRegistry build_default_registry();
