#include <knotview/errors.hpp>
#include <knotview/logger.hpp>
#include <knotview/resolver.hpp>

namespace knotview
{

RenderMode BackendResolver::resolve(RenderMode mode) const
{
    if (mode != RenderMode::Auto)
    {
        return mode;
    }

    std::vector<NoBackendAvailable::Attempt> attempts;
    for (const auto& toolkit : registry_.candidates())
    {
        try
        {
            // The trial context is dropped here; rendering acquires its own.
            toolkit->acquire(registry_.config());
        }
        catch (const ToolkitUnavailable& e)
        {
            KNOTVIEW_LOG_WARN("resolver",
                              "Availability check of {} failed: {}",
                              render_mode_name(toolkit->mode()),
                              e.reason());
            attempts.push_back({toolkit->mode(), e.reason()});
            continue;
        }

        KNOTVIEW_LOG_DEBUG("resolver", "Auto mode resolved to {}", render_mode_name(toolkit->mode()));
        return toolkit->mode();
    }

    KNOTVIEW_LOG_ERROR("resolver", "No rendering backend available ({} tried)", attempts.size());
    throw NoBackendAvailable(std::move(attempts));
}

RenderMode BackendResolver::resolve(std::string_view mode) const
{
    return resolve(parse_render_mode(mode));
}

}   // namespace knotview
