#pragma once

// Umbrella header: includes the public knotview API.
// Eigen adapters live in <knotview/eigen.hpp> (KNOTVIEW_USE_EIGEN).

#include <knotview/axes.hpp>
#include <knotview/axes3d.hpp>
#include <knotview/boundary.hpp>
#include <knotview/camera.hpp>
#include <knotview/color.hpp>
#include <knotview/color_assigner.hpp>
#include <knotview/config.hpp>
#include <knotview/errors.hpp>
#include <knotview/export.hpp>
#include <knotview/figure.hpp>
#include <knotview/fwd.hpp>
#include <knotview/logger.hpp>
#include <knotview/math3d.hpp>
#include <knotview/plot.hpp>
#include <knotview/render_mode.hpp>
#include <knotview/resolver.hpp>
#include <knotview/series.hpp>
#include <knotview/series3d.hpp>
#include <knotview/toolkit.hpp>
#include <knotview/tube.hpp>
