#pragma once

// Umbrella header: the full public API.

#include <plumix/core/backend.hpp>
#include <plumix/core/domain.hpp>
#include <plumix/core/errors.hpp>

#include <plumix/field/advection.hpp>
#include <plumix/field/field_ops.hpp>
#include <plumix/field/grid_field.hpp>
#include <plumix/field/staggered_ops.hpp>

#include <plumix/world/geometry.hpp>
#include <plumix/world/world.hpp>

#include <plumix/solver/conjugate_gradient.hpp>
#include <plumix/solver/jacobi.hpp>
#include <plumix/solver/poisson.hpp>
#include <plumix/solver/pressure_solver.hpp>

#include <plumix/physics/diagnostics.hpp>
#include <plumix/physics/domain_state.hpp>
#include <plumix/physics/observer.hpp>
#include <plumix/physics/physics.hpp>
#include <plumix/physics/smoke.hpp>
#include <plumix/physics/smoke_state.hpp>

#include <plumix/io/vtk_export.hpp>
