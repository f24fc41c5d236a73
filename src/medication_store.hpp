#pragma once
#include "database.hpp"
#include "models.hpp"
#include "utils.hpp"
#include <string>
#include <vector>
#include <optional>

namespace dosewatch {

class MedicationStore {
public:
    explicit MedicationStore(Database& db, Clock clock = epoch_now_ms);

    MedicationStore(const MedicationStore&) = delete;
    MedicationStore& operator=(const MedicationStore&) = delete;

    // Assigns an id when empty; sets created_at/updated_at.
    Medication create(Medication med);
    std::optional<Medication> get(const std::string& id);
    Medication require(const std::string& id);   // throws NotFoundError
    std::vector<Medication> list_by_profile(const std::string& owner_id, const std::string& profile_id);
    std::vector<Medication> find_by_name(const std::string& owner_id, const std::string& profile_id,
                                         const std::string& fragment);
    // Keeps id, owner, profile and created_at; refreshes updated_at.
    Medication update(const Medication& med);
    // Deletes the medication with its schedules, dose-times and intake logs.
    bool remove(const std::string& id);

private:
    Database& db_;
    Clock clock_;

    static void validate(const Medication& med);
};

} // namespace dosewatch
