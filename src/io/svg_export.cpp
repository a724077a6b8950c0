#include <cstdio>
#include <fstream>
#include <knotview/axes.hpp>
#include <knotview/axes3d.hpp>
#include <knotview/boundary.hpp>
#include <knotview/export.hpp>
#include <knotview/figure.hpp>
#include <knotview/series.hpp>
#include <knotview/series3d.hpp>
#include <sstream>
#include <vector>

namespace knotview
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

std::string svg_color(const Color& c)
{
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "rgb(%d,%d,%d)",
                  static_cast<int>(clampf(c.r, 0.0f, 1.0f) * 255.0f),
                  static_cast<int>(clampf(c.g, 0.0f, 1.0f) * 255.0f),
                  static_cast<int>(clampf(c.b, 0.0f, 1.0f) * 255.0f));
    return buf;
}

// Compact float (no trailing zeros)
std::string fmt(float v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", static_cast<double>(v));
    return buf;
}

std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Data coordinates to SVG pixels within a viewport (SVG is Y-down).
struct DataToSvg
{
    float  vp_x, vp_y, vp_w, vp_h;
    double x_min, x_max, y_min, y_max;

    float map_x(float data_x) const
    {
        double range = x_max - x_min;
        if (range == 0.0)
            range = 1.0;
        return static_cast<float>(vp_x + (data_x - x_min) / range * vp_w);
    }

    float map_y(float data_y) const
    {
        double range = y_max - y_min;
        if (range == 0.0)
            range = 1.0;
        return static_cast<float>(vp_y + (1.0 - (data_y - y_min) / range) * vp_h);
    }
};

// World coordinates to SVG pixels through a camera.
struct WorldToSvg
{
    Rect vp;
    mat4 view_proj;

    bool project(vec3 p, float& sx, float& sy) const
    {
        vec4 clip = mat4_mul_vec4(view_proj, vec4{p, 1.0});
        if (clip.w <= 1e-9)
            return false;
        double nx = clip.x / clip.w;
        double ny = clip.y / clip.w;
        // Clip space is Y-down already
        sx = static_cast<float>(vp.x + (nx * 0.5 + 0.5) * vp.w);
        sy = static_cast<float>(vp.y + (ny * 0.5 + 0.5) * vp.h);
        return true;
    }
};

void emit_grid(std::ostringstream& svg, const Axes& axes, const DataToSvg& m)
{
    if (!axes.grid_enabled())
        return;

    auto x_ticks = axes.compute_x_ticks();
    auto y_ticks = axes.compute_y_ticks();
    if (x_ticks.positions.empty() && y_ticks.positions.empty())
        return;

    svg << "    <g class=\"grid\" stroke=\"" << svg_color(axes.axis_style().grid_color)
        << "\" stroke-width=\"1\" stroke-dasharray=\"4,2\">\n";

    for (float tx : x_ticks.positions)
    {
        float sx = m.map_x(tx);
        svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(m.vp_y) << "\" x2=\"" << fmt(sx)
            << "\" y2=\"" << fmt(m.vp_y + m.vp_h) << "\"/>\n";
    }

    for (float ty : y_ticks.positions)
    {
        float sy = m.map_y(ty);
        svg << "      <line x1=\"" << fmt(m.vp_x) << "\" y1=\"" << fmt(sy) << "\" x2=\""
            << fmt(m.vp_x + m.vp_w) << "\" y2=\"" << fmt(sy) << "\"/>\n";
    }

    svg << "    </g>\n";
}

void emit_border(std::ostringstream& svg, const Rect& vp)
{
    svg << "    <rect class=\"border\" x=\"" << fmt(vp.x) << "\" y=\"" << fmt(vp.y)
        << "\" width=\"" << fmt(vp.w) << "\" height=\"" << fmt(vp.h)
        << "\" fill=\"none\" stroke=\"#000\" stroke-width=\"1\"/>\n";
}

void emit_tick_labels(std::ostringstream& svg, const Axes& axes, const DataToSvg& m)
{
    auto x_ticks = axes.compute_x_ticks();
    auto y_ticks = axes.compute_y_ticks();
    if (x_ticks.positions.empty() && y_ticks.positions.empty())
        return;

    const float     tick_len     = axes.axis_style().tick_length;
    constexpr float label_offset = 14.0f;
    constexpr float font_size    = 10.0f;

    svg << "    <g class=\"tick-labels\" font-family=\"sans-serif\" font-size=\""
        << fmt(font_size) << "\" fill=\"#333\">\n";

    // X-axis (bottom)
    for (size_t i = 0; i < x_ticks.positions.size(); ++i)
    {
        float sx     = m.map_x(x_ticks.positions[i]);
        float bottom = m.vp_y + m.vp_h;
        svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(bottom) << "\" x2=\"" << fmt(sx)
            << "\" y2=\"" << fmt(bottom + tick_len) << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
        svg << "      <text x=\"" << fmt(sx) << "\" y=\"" << fmt(bottom + label_offset)
            << "\" text-anchor=\"middle\">" << xml_escape(x_ticks.labels[i]) << "</text>\n";
    }

    // Y-axis (left)
    for (size_t i = 0; i < y_ticks.positions.size(); ++i)
    {
        float sy = m.map_y(y_ticks.positions[i]);
        svg << "      <line x1=\"" << fmt(m.vp_x - tick_len) << "\" y1=\"" << fmt(sy) << "\" x2=\""
            << fmt(m.vp_x) << "\" y2=\"" << fmt(sy) << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
        svg << "      <text x=\"" << fmt(m.vp_x - tick_len - 3.0f) << "\" y=\"" << fmt(sy + 3.5f)
            << "\" text-anchor=\"end\">" << xml_escape(y_ticks.labels[i]) << "</text>\n";
    }

    svg << "    </g>\n";
}

void emit_title(std::ostringstream& svg, const AxesBase& axes, const Rect& vp)
{
    if (axes.title().empty())
        return;

    float cx = vp.x + vp.w * 0.5f;
    float ty = vp.y - 10.0f;
    svg << "    <text x=\"" << fmt(cx) << "\" y=\"" << fmt(ty)
        << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
        << fmt(axes.axis_style().title_size) << "\" font-weight=\"bold\" fill=\"#000\">"
        << xml_escape(axes.title()) << "</text>\n";
}

void emit_labels(std::ostringstream& svg, const Axes& axes, const DataToSvg& m)
{
    const float label_font = axes.axis_style().label_size;

    if (!axes.xlabel().empty())
    {
        float cx = m.vp_x + m.vp_w * 0.5f;
        float ly = m.vp_y + m.vp_h + 35.0f;
        svg << "    <text x=\"" << fmt(cx) << "\" y=\"" << fmt(ly)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
            << fmt(label_font) << "\" fill=\"#333\">" << xml_escape(axes.xlabel()) << "</text>\n";
    }

    if (!axes.ylabel().empty())
    {
        float cy = m.vp_y + m.vp_h * 0.5f;
        float lx = m.vp_x - 45.0f;
        svg << "    <text x=\"" << fmt(lx) << "\" y=\"" << fmt(cy)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
            << fmt(label_font) << "\" fill=\"#333\" transform=\"rotate(-90," << fmt(lx) << ","
            << fmt(cy) << ")\">" << xml_escape(axes.ylabel()) << "</text>\n";
    }
}

void emit_marker(std::ostringstream& svg, MarkerStyle style, float cx, float cy, float r)
{
    switch (style)
    {
        case MarkerStyle::None:
            break;
        case MarkerStyle::Circle:
            svg << "      <circle cx=\"" << fmt(cx) << "\" cy=\"" << fmt(cy) << "\" r=\"" << fmt(r)
                << "\"/>\n";
            break;
        case MarkerStyle::Square:
            svg << "      <rect x=\"" << fmt(cx - r) << "\" y=\"" << fmt(cy - r) << "\" width=\""
                << fmt(2.0f * r) << "\" height=\"" << fmt(2.0f * r) << "\"/>\n";
            break;
        case MarkerStyle::Cross:
            svg << "      <path d=\"M" << fmt(cx - r) << "," << fmt(cy - r) << " L" << fmt(cx + r)
                << "," << fmt(cy + r) << " M" << fmt(cx - r) << "," << fmt(cy + r) << " L"
                << fmt(cx + r) << "," << fmt(cy - r) << "\" stroke-width=\"1.5\"/>\n";
            break;
    }
}

void emit_line_series(std::ostringstream& svg, const LineSeries& series, const DataToSvg& m)
{
    if (series.point_count() == 0)
        return;

    auto        x       = series.x_data();
    auto        y       = series.y_data();
    const auto& c       = series.color();
    float       opacity = c.a * series.opacity();

    if (series.point_count() >= 2)
    {
        svg << "    <polyline class=\"line\" fill=\"none\" stroke=\"" << svg_color(c)
            << "\" stroke-width=\"" << fmt(series.width()) << "\" stroke-opacity=\""
            << fmt(opacity) << "\" stroke-linejoin=\"round\" stroke-linecap=\"round\" points=\"";

        for (size_t i = 0; i < series.point_count(); ++i)
        {
            if (i > 0)
                svg << " ";
            svg << fmt(m.map_x(x[i])) << "," << fmt(m.map_y(y[i]));
        }

        svg << "\"/>\n";
    }

    if (series.marker() != MarkerStyle::None)
    {
        svg << "    <g fill=\"" << svg_color(c) << "\" stroke=\"" << svg_color(c)
            << "\" fill-opacity=\"" << fmt(opacity) << "\">\n";
        for (size_t i = 0; i < series.point_count(); ++i)
        {
            emit_marker(svg, series.marker(), m.map_x(x[i]), m.map_y(y[i]), 3.0f);
        }
        svg << "    </g>\n";
    }
}

void emit_scatter_series(std::ostringstream& svg, const ScatterSeries& series, const DataToSvg& m)
{
    if (series.point_count() == 0)
        return;

    auto        x = series.x_data();
    auto        y = series.y_data();
    float       r = series.size() * 0.5f;
    const auto& c = series.color();

    svg << "    <g class=\"scatter\" fill=\"" << svg_color(c) << "\" stroke=\"" << svg_color(c)
        << "\" fill-opacity=\"" << fmt(c.a * series.opacity()) << "\">\n";

    for (size_t i = 0; i < series.point_count(); ++i)
    {
        emit_marker(svg, series.marker(), m.map_x(x[i]), m.map_y(y[i]), r);
    }

    svg << "    </g>\n";
}

void emit_legend(std::ostringstream& svg, const AxesBase& axes, const Rect& vp)
{
    struct LegendEntry
    {
        std::string label;
        Color       color;
        bool        is_line;
    };
    std::vector<LegendEntry> entries;

    for (const auto& s : axes.series())
    {
        if (!s || s->label().empty())
            continue;
        bool is_line = dynamic_cast<const ScatterSeries*>(s.get()) == nullptr;
        entries.push_back({s->label(), s->color(), is_line});
    }

    if (entries.empty())
        return;

    constexpr float entry_h   = 18.0f;
    constexpr float padding   = 8.0f;
    constexpr float swatch_w  = 20.0f;
    constexpr float gap       = 6.0f;
    constexpr float font_size = 10.0f;

    float legend_h = padding * 2.0f + static_cast<float>(entries.size()) * entry_h;
    float legend_w = 120.0f;
    float lx       = vp.x + vp.w - legend_w - 10.0f;
    float ly       = vp.y + 10.0f;

    svg << "    <rect x=\"" << fmt(lx) << "\" y=\"" << fmt(ly) << "\" width=\"" << fmt(legend_w)
        << "\" height=\"" << fmt(legend_h)
        << "\" fill=\"white\" fill-opacity=\"0.9\" stroke=\"#ccc\" stroke-width=\"1\" rx=\"3\"/>\n";

    svg << "    <g font-family=\"sans-serif\" font-size=\"" << fmt(font_size)
        << "\" fill=\"#333\">\n";

    for (size_t i = 0; i < entries.size(); ++i)
    {
        float ey = ly + padding + static_cast<float>(i) * entry_h + entry_h * 0.5f;
        float ex = lx + padding;

        if (entries[i].is_line)
        {
            svg << "      <line x1=\"" << fmt(ex) << "\" y1=\"" << fmt(ey) << "\" x2=\""
                << fmt(ex + swatch_w) << "\" y2=\"" << fmt(ey) << "\" stroke=\""
                << svg_color(entries[i].color) << "\" stroke-width=\"2\"/>\n";
        }
        else
        {
            svg << "      <circle cx=\"" << fmt(ex + swatch_w * 0.5f) << "\" cy=\"" << fmt(ey)
                << "\" r=\"4\" fill=\"" << svg_color(entries[i].color) << "\"/>\n";
        }

        svg << "      <text x=\"" << fmt(ex + swatch_w + gap) << "\" y=\"" << fmt(ey + 3.5f)
            << "\">" << xml_escape(entries[i].label) << "</text>\n";
    }

    svg << "    </g>\n";
}

void emit_clip_open(std::ostringstream& svg, const Rect& vp)
{
    std::string id = "clip-" + fmt(vp.x) + "-" + fmt(vp.y);
    svg << "    <defs>\n";
    svg << "      <clipPath id=\"" << id << "\">\n";
    svg << "        <rect x=\"" << fmt(vp.x) << "\" y=\"" << fmt(vp.y) << "\" width=\""
        << fmt(vp.w) << "\" height=\"" << fmt(vp.h) << "\"/>\n";
    svg << "      </clipPath>\n";
    svg << "    </defs>\n";
    svg << "    <g clip-path=\"url(#" << id << ")\">\n";
}

void emit_axes(std::ostringstream& svg, const Axes& axes)
{
    const Rect& viewport = axes.viewport();
    auto        xlim     = axes.x_limits();
    auto        ylim     = axes.y_limits();

    DataToSvg m;
    m.vp_x  = viewport.x;
    m.vp_y  = viewport.y;
    m.vp_w  = viewport.w;
    m.vp_h  = viewport.h;
    m.x_min = xlim.min;
    m.x_max = xlim.max;
    m.y_min = ylim.min;
    m.y_max = ylim.max;

    svg << "  <g class=\"axes\">\n";

    emit_grid(svg, axes, m);
    if (axes.border_enabled())
        emit_border(svg, viewport);

    emit_clip_open(svg, viewport);
    for (const auto& series_ptr : axes.series())
    {
        if (!series_ptr)
            continue;

        if (auto* ls = dynamic_cast<const LineSeries*>(series_ptr.get()))
        {
            emit_line_series(svg, *ls, m);
        }
        else if (auto* ss = dynamic_cast<const ScatterSeries*>(series_ptr.get()))
        {
            emit_scatter_series(svg, *ss, m);
        }
    }
    svg << "    </g>\n";

    emit_tick_labels(svg, axes, m);
    emit_title(svg, axes, viewport);
    emit_labels(svg, axes, m);
    emit_legend(svg, axes, viewport);

    svg << "  </g>\n";
}

// ─── 3D ──────────────────────────────────────────────────────────────────────

void emit_line_series_3d(std::ostringstream& svg, const LineSeries3D& series, const WorldToSvg& w)
{
    if (series.point_count() < 2)
        return;

    auto x = series.x_data();
    auto y = series.y_data();
    auto z = series.z_data();

    svg << "    <polyline class=\"line3d\" fill=\"none\" stroke=\"" << svg_color(series.color())
        << "\" stroke-width=\"" << fmt(series.width()) << "\" stroke-opacity=\""
        << fmt(series.color().a * series.opacity())
        << "\" stroke-linejoin=\"round\" stroke-linecap=\"round\" points=\"";

    bool first = true;
    for (size_t i = 0; i < series.point_count(); ++i)
    {
        float sx, sy;
        if (!w.project({x[i], y[i], z[i]}, sx, sy))
            continue;
        if (!first)
            svg << " ";
        svg << fmt(sx) << "," << fmt(sy);
        first = false;
    }

    svg << "\"/>\n";
}

void emit_bounding_box(std::ostringstream& svg, const Axes3D& axes, const WorldToSvg& w)
{
    auto        xl = axes.x_limits();
    auto        yl = axes.y_limits();
    auto        zl = axes.z_limits();
    BoundingBox box{xl.min, xl.max, yl.min, yl.max, zl.min, zl.max};

    svg << "    <g class=\"bounding-box\" stroke=\"" << svg_color(axes.axis_style().grid_color)
        << "\" stroke-width=\"1\">\n";
    for (const auto& edge : box.edges())
    {
        float x1, y1, x2, y2;
        if (!w.project(edge[0], x1, y1) || !w.project(edge[1], x2, y2))
            continue;
        svg << "      <line x1=\"" << fmt(x1) << "\" y1=\"" << fmt(y1) << "\" x2=\"" << fmt(x2)
            << "\" y2=\"" << fmt(y2) << "\"/>\n";
    }
    svg << "    </g>\n";
}

void emit_axes3d(std::ostringstream& svg, const Axes3D& axes)
{
    const Rect& viewport = axes.viewport();
    float       aspect   = viewport.h > 0.0f ? viewport.w / viewport.h : 1.0f;

    WorldToSvg w;
    w.vp        = viewport;
    w.view_proj = mat4_mul(axes.camera().projection_matrix(aspect), axes.camera().view_matrix());

    svg << "  <g class=\"axes3d\">\n";

    emit_clip_open(svg, viewport);
    if (axes.show_bounding_box())
        emit_bounding_box(svg, axes, w);

    for (const auto& series_ptr : axes.series())
    {
        if (auto* ls = dynamic_cast<const LineSeries3D*>(series_ptr.get()))
        {
            emit_line_series_3d(svg, *ls, w);
        }
    }
    svg << "    </g>\n";

    emit_title(svg, axes, viewport);
    emit_legend(svg, axes, viewport);

    svg << "  </g>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(const Figure& figure)
{
    uint32_t w = figure.width();
    uint32_t h = figure.height();

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << w << "\" height=\"" << h
        << "\" viewBox=\"0 0 " << w << " " << h << "\">\n";

    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(figure.style().background)
        << "\"/>\n";

    // Viewports come from the last Figure::compute_layout().
    for (const auto& axes_ptr : figure.axes())
    {
        if (!axes_ptr)
            continue;
        if (auto* a3 = dynamic_cast<const Axes3D*>(axes_ptr.get()))
        {
            emit_axes3d(svg, *a3);
        }
        else if (auto* a2 = dynamic_cast<const Axes*>(axes_ptr.get()))
        {
            emit_axes(svg, *a2);
        }
    }

    svg << "</svg>\n";
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, const Figure& figure)
{
    std::string content = to_string(figure);

    std::ofstream file(path);
    if (!file.is_open())
    {
        return false;
    }

    file << content;
    return file.good();
}

}   // namespace knotview
