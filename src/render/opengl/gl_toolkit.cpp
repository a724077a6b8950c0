#include <knotview/errors.hpp>
#include <knotview/logger.hpp>
#include <knotview/toolkit.hpp>

#ifdef KNOTVIEW_USE_GLFW

    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <array>
    #include <cmath>
    #include <knotview/tube.hpp>
    #include <optional>

namespace knotview
{

namespace
{

// glfwInit/glfwTerminate shared by all live contexts.
class GlfwSession
{
   public:
    static bool acquire()
    {
        if (refs_ == 0 && !glfwInit())
            return false;
        ++refs_;
        return true;
    }

    static void release()
    {
        if (refs_ > 0 && --refs_ == 0)
            glfwTerminate();
    }

   private:
    static inline int refs_ = 0;
};

struct GlVisual
{
    std::optional<TubeMesh>          mesh;
    std::vector<std::array<vec3, 2>> segments;
    Color                            line_color = colors::black;
    vec3                             translation;
};

// Retained scene drawn with the fixed-function pipeline. The window stays
// hidden until show(), which runs until the user closes it.
class GlContext : public RenderContext
{
   public:
    GlContext(const RenderConfig& config, GLFWwindow* window) : config_(config), window_(window)
    {
        glfwSetWindowUserPointer(window_, this);
        glfwSetCursorPosCallback(window_, cursor_pos_callback);
        glfwSetMouseButtonCallback(window_, mouse_button_callback);
        glfwSetScrollCallback(window_, scroll_callback);

        camera_.up_axis   = UpAxis::Z;
        camera_.azimuth   = 30.0f;
        camera_.elevation = 30.0f;
    }

    ~GlContext() override
    {
        glfwDestroyWindow(window_);
        GlfwSession::release();
    }

    GlContext(const GlContext&)            = delete;
    GlContext& operator=(const GlContext&) = delete;

    RenderMode backend() const override { return RenderMode::OpenGL; }

    Capabilities capabilities() const override
    {
        Capabilities caps;
        caps.tube             = true;
        caps.per_point_colors = true;
        caps.camera           = true;
        return caps;
    }

    void clear() override
    {
        visuals_.clear();
        camera_setup_.reset();
    }

    void draw_tube(std::span<const vec3>  points,
                   std::span<const Color> colors,
                   double                 radius,
                   int                    sides) override
    {
        GlVisual v;
        v.mesh = build_tube(points, colors, radius, sides > 0 ? sides : config_.tube_points);
        visuals_.push_back(std::move(v));
    }

    void draw_polyline_3d(std::span<const vec3> points, const Color& color) override
    {
        GlVisual v;
        v.line_color = color;
        for (size_t i = 0; i + 1 < points.size(); ++i)
            v.segments.push_back({points[i], points[i + 1]});
        visuals_.push_back(std::move(v));
    }

    void set_camera(const CameraSetup& setup) override { camera_setup_ = setup; }

    void set_translation(vec3 offset) override
    {
        if (!visuals_.empty())
            visuals_.back().translation = offset;
    }

    void draw_box(const BoundingBox& box, const Color& color) override
    {
        GlVisual v;
        v.line_color = color;
        for (const auto& e : box.edges())
            v.segments.push_back(e);
        visuals_.push_back(std::move(v));
    }

    std::string show() override
    {
        frame_camera();

        glfwMakeContextCurrent(window_);
        glfwSwapInterval(1);
        glfwShowWindow(window_);
        glfwFocusWindow(window_);

        glEnable(GL_DEPTH_TEST);
        glEnable(GL_LIGHTING);
        glEnable(GL_LIGHT0);
        glEnable(GL_NORMALIZE);
        glEnable(GL_COLOR_MATERIAL);
        glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);
        glLightModeli(GL_LIGHT_MODEL_TWO_SIDE, GL_TRUE);
        glShadeModel(GL_SMOOTH);

        KNOTVIEW_LOG_INFO("opengl", "Showing {} visuals", visuals_.size());
        while (!glfwWindowShouldClose(window_))
        {
            render_frame();
            glfwSwapBuffers(window_);
            glfwWaitEvents();
        }

        glfwHideWindow(window_);
        glfwSetWindowShouldClose(window_, GLFW_FALSE);
        return {};
    }

   private:
    void frame_camera()
    {
        camera_.target = {0.0, 0.0, 0.0};
        if (camera_setup_)
        {
            camera_.up_axis  = camera_setup_->up_axis;
            camera_.distance = static_cast<float>(camera_setup_->distance);
            camera_.far_clip = camera_.distance * 100.0f;
            camera_.update_position_from_orbit();
            return;
        }

        bool first = true;
        vec3 lo, hi;
        for (const auto& v : visuals_)
        {
            auto extend = [&](vec3 p)
            {
                p += v.translation;
                lo    = first ? p : vec3_min(lo, p);
                hi    = first ? p : vec3_max(hi, p);
                first = false;
            };
            if (v.mesh)
                for (const auto& p : v.mesh->positions)
                    extend(p);
            for (const auto& s : v.segments)
            {
                extend(s[0]);
                extend(s[1]);
            }
        }
        camera_.fit_to_bounds(lo, hi);
    }

    void render_frame()
    {
        int width = 0, height = 0;
        glfwGetFramebufferSize(window_, &width, &height);
        if (width <= 0 || height <= 0)
            return;
        glViewport(0, 0, width, height);

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        float aspect = static_cast<float>(width) / static_cast<float>(height);
        float near   = std::max(1e-3f, camera_.distance * 0.01f);
        float top    = near * std::tan(deg_to_rad(camera_.fov) * 0.5f);
        float right  = top * aspect;
        glFrustum(-right, right, -top, top, near, camera_.far_clip);

        glMatrixMode(GL_MODELVIEW);
        mat4 view = camera_.view_matrix();
        glLoadMatrixf(view.m);

        // Headlight along the view direction
        vec3    eye         = vec3_normalize(camera_.position - camera_.target);
        GLfloat light_pos[] = {static_cast<GLfloat>(eye.x),
                               static_cast<GLfloat>(eye.y),
                               static_cast<GLfloat>(eye.z),
                               0.0f};
        glLightfv(GL_LIGHT0, GL_POSITION, light_pos);

        glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        for (const auto& v : visuals_)
        {
            glPushMatrix();
            glTranslated(v.translation.x, v.translation.y, v.translation.z);

            if (v.mesh)
            {
                glEnable(GL_LIGHTING);
                glBegin(GL_TRIANGLES);
                for (uint32_t idx : v.mesh->indices)
                {
                    const Color& c = v.mesh->colors[idx];
                    const vec3&  n = v.mesh->normals[idx];
                    const vec3&  p = v.mesh->positions[idx];
                    glColor4f(c.r, c.g, c.b, c.a);
                    glNormal3d(n.x, n.y, n.z);
                    glVertex3d(p.x, p.y, p.z);
                }
                glEnd();
            }

            if (!v.segments.empty())
            {
                glDisable(GL_LIGHTING);
                glLineWidth(1.5f);
                glColor4f(v.line_color.r, v.line_color.g, v.line_color.b, v.line_color.a);
                glBegin(GL_LINES);
                for (const auto& s : v.segments)
                {
                    glVertex3d(s[0].x, s[0].y, s[0].z);
                    glVertex3d(s[1].x, s[1].y, s[1].z);
                }
                glEnd();
            }

            glPopMatrix();
        }
    }

    // ─── Input: drag to orbit, scroll to zoom ───────────────────────────────

    static void cursor_pos_callback(GLFWwindow* window, double x, double y)
    {
        auto* ctx = static_cast<GlContext*>(glfwGetWindowUserPointer(window));
        if (!ctx)
            return;
        if (ctx->dragging_)
        {
            ctx->camera_.orbit(static_cast<float>(ctx->last_x_ - x) * 0.3f,
                               static_cast<float>(y - ctx->last_y_) * 0.3f);
        }
        ctx->last_x_ = x;
        ctx->last_y_ = y;
    }

    static void mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
    {
        auto* ctx = static_cast<GlContext*>(glfwGetWindowUserPointer(window));
        if (ctx && button == GLFW_MOUSE_BUTTON_LEFT)
        {
            ctx->dragging_ = action == GLFW_PRESS;
            glfwGetCursorPos(window, &ctx->last_x_, &ctx->last_y_);
        }
    }

    static void scroll_callback(GLFWwindow* window, double /*x_offset*/, double y_offset)
    {
        auto* ctx = static_cast<GlContext*>(glfwGetWindowUserPointer(window));
        if (ctx)
            ctx->camera_.zoom(y_offset > 0.0 ? 0.9f : 1.1f);
    }

    RenderConfig               config_;
    GLFWwindow*                window_;
    Camera                     camera_;
    std::vector<GlVisual>      visuals_;
    std::optional<CameraSetup> camera_setup_;
    bool                       dragging_ = false;
    double                     last_x_   = 0.0;
    double                     last_y_   = 0.0;
};

class GlToolkit : public Toolkit
{
   public:
    RenderMode mode() const override { return RenderMode::OpenGL; }

    std::unique_ptr<RenderContext> acquire(const RenderConfig& config) override
    {
        if (!GlfwSession::acquire())
        {
            throw ToolkitUnavailable(RenderMode::OpenGL, "glfwInit failed");
        }

        glfwDefaultWindowHints();
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

        GLFWwindow* window = glfwCreateWindow(static_cast<int>(config.width),
                                              static_cast<int>(config.height),
                                              "knotview",
                                              nullptr,
                                              nullptr);
        if (!window)
        {
            GlfwSession::release();
            throw ToolkitUnavailable(RenderMode::OpenGL, "cannot create an OpenGL window");
        }

        return std::make_unique<GlContext>(config, window);
    }
};

}   // anonymous namespace

std::unique_ptr<Toolkit> make_opengl_toolkit()
{
    return std::make_unique<GlToolkit>();
}

}   // namespace knotview

#else   // KNOTVIEW_USE_GLFW

namespace knotview
{

namespace
{

class GlToolkit : public Toolkit
{
   public:
    RenderMode mode() const override { return RenderMode::OpenGL; }

    std::unique_ptr<RenderContext> acquire(const RenderConfig& /*config*/) override
    {
        throw ToolkitUnavailable(RenderMode::OpenGL, "built without GLFW support");
    }
};

}   // anonymous namespace

std::unique_ptr<Toolkit> make_opengl_toolkit()
{
    return std::make_unique<GlToolkit>();
}

}   // namespace knotview

#endif   // KNOTVIEW_USE_GLFW
