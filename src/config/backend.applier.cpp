#include "backend.applier.hh"
#include "dsio.common.hh"
#include "errors.hh"
#include "macros.hh"

#include <algorithm>

void
dsio::apply_configuration(const BackendConfiguration& configuration,
                          WriterHandle& handle)
{
    EXPECT_AS(AlreadyConfiguredError,
              !handle.is_configured(),
              "Writer has already been configured");

    std::vector<std::pair<WriterTarget*, nlohmann::json>> updates;
    for (const auto& descriptor : configuration) {
        auto* target =
          handle.find_target(descriptor.object_id(), descriptor.dataset_name());
        EXPECT_FOUND(TargetNotFoundError,
                     target != nullptr,
                     handle.target_keys(),
                     "No target for dataset '",
                     descriptor.dataset_name(),
                     "' of object '",
                     descriptor.object_id(),
                     "' (location '",
                     descriptor.location(),
                     "'). Available targets: ",
                     join(handle.target_keys()));

        if (target->is_link) {
            LOG_DEBUG("Skipping link at location '", descriptor.location(), "'");
            continue;
        }

        EXPECT_AS(AlreadyConfiguredError,
                  !target->io_arguments.has_value(),
                  "Dataset at location '",
                  descriptor.location(),
                  "' already has I/O arguments");

        const bool claimed =
          std::any_of(updates.begin(), updates.end(), [target](const auto& u) {
              return u.first == target;
          });
        EXPECT_AS(AlreadyConfiguredError,
                  !claimed,
                  "Dataset '",
                  descriptor.dataset_name(),
                  "' of object '",
                  descriptor.object_id(),
                  "' is configured by more than one location, including '",
                  descriptor.location(),
                  "'");

        updates.emplace_back(
          target, configuration.catalog()->build_io_arguments(descriptor));
    }

    for (auto& [target, arguments] : updates) {
        target->io_arguments = std::move(arguments);
    }

    if (configuration.backend() == DsioBackend_Zarr) {
        handle.set_number_of_jobs(configuration.number_of_jobs());
    }
    handle.mark_configured();

    LOG_DEBUG("Configured ",
              updates.size(),
              " datasets for the ",
              backend_to_string(configuration.backend()),
              " backend");
}
