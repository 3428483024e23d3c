#pragma once

#include "backend.configuration.hh"
#include "writer.handle.hh"

namespace dsio {
/**
 * @brief Attach the I/O arguments of every descriptor in @p configuration to
 * its target in @p handle.
 * @details Every target is resolved and checked before any is modified. Link
 * targets are configured where their data lives and are skipped. For Zarr,
 * the number of jobs is set on the handle.
 * @throw TargetNotFoundError if a descriptor's object id and dataset name
 * match no target.
 * @throw AlreadyConfiguredError if the handle, or one of the targets, was
 * already configured.
 */
void
apply_configuration(const BackendConfiguration& configuration,
                    WriterHandle& handle);
} // namespace dsio
