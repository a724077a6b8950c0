#include <algorithm>
#include <knotview/logger.hpp>
#include <knotview/toolkit.hpp>
#include <stdexcept>

namespace knotview
{

ToolkitRegistry& ToolkitRegistry::add(std::unique_ptr<Toolkit> toolkit)
{
    if (!toolkit)
    {
        throw std::invalid_argument("null toolkit");
    }
    if (toolkit->mode() == RenderMode::Auto)
    {
        throw std::invalid_argument("a toolkit cannot register as auto");
    }

    auto it = std::find_if(toolkits_.begin(),
                           toolkits_.end(),
                           [&](const auto& t) { return t->mode() == toolkit->mode(); });
    if (it != toolkits_.end())
    {
        *it = std::move(toolkit);
    }
    else
    {
        toolkits_.push_back(std::move(toolkit));
    }
    return *this;
}

Toolkit* ToolkitRegistry::find(RenderMode mode) const
{
    for (const auto& t : toolkits_)
    {
        if (t->mode() == mode)
            return t.get();
    }
    return nullptr;
}

ToolkitRegistry& ToolkitRegistry::default_registry()
{
    static ToolkitRegistry registry(RenderConfig::from_env());
    static const bool      populated = [&]
    {
        registry.add(make_opengl_toolkit());
        registry.add(make_svg_toolkit());
        registry.add(make_raster_toolkit());
        KNOTVIEW_LOG_DEBUG("resolver",
                           "Default registry holds {} toolkits",
                           registry.candidates().size());
        return true;
    }();
    (void)populated;
    return registry;
}

}   // namespace knotview
