#include <algorithm>
#include <knotview/series.hpp>

namespace knotview
{

// Mismatched inputs keep only the common prefix.
XYSeries::XYSeries(std::span<const float> x, std::span<const float> y)
{
    size_t n = std::min(x.size(), y.size());
    x_.assign(x.begin(), x.begin() + n);
    y_.assign(y.begin(), y.begin() + n);
}

void XYSeries::append(float x, float y)
{
    x_.push_back(x);
    y_.push_back(y);
}

}   // namespace knotview
