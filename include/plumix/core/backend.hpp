#pragma once

#include <Kokkos_Core.hpp>

namespace plumix {

#if defined(PLUMIX_EXECSPACE_CUDA)
using ExecSpace = Kokkos::Cuda;
#elif defined(PLUMIX_EXECSPACE_OPENMP)
using ExecSpace = Kokkos::OpenMP;
#elif defined(PLUMIX_EXECSPACE_SERIAL)
using ExecSpace = Kokkos::Serial;
#else
using ExecSpace = Kokkos::DefaultExecutionSpace;
#endif

#if defined(PLUMIX_MEMORYSPACE_FORCE_UVM)
using DeviceMemorySpace = Kokkos::CudaUVMSpace;
#elif defined(PLUMIX_MEMORYSPACE_FORCE_HOSTPINNED)
using DeviceMemorySpace = Kokkos::HostPinnedSpace;
#else
using DeviceMemorySpace = typename ExecSpace::memory_space;
#endif

using HostMemorySpace = Kokkos::HostSpace;

#if defined(PLUMIX_REAL_FLOAT)
using Real = float;
#else
using Real = double;
#endif

/// Grid fields are stored as (batch, n0, n1, n2); unused axes have extent 1.
using GridView = Kokkos::View<Real****, DeviceMemorySpace>;
using GridHostView = typename GridView::HostMirror;

/// Per-cell masks shared by every batch entry: (n0, n1, n2).
using MaskView = Kokkos::View<Real***, DeviceMemorySpace>;

using Policy4D = Kokkos::MDRangePolicy<ExecSpace, Kokkos::Rank<4>>;
using Policy3D = Kokkos::MDRangePolicy<ExecSpace, Kokkos::Rank<3>>;

inline constexpr int max_rank = 3;

} // namespace plumix
