#pragma once

#include <cstddef>

namespace knotview
{

class Figure;
class Axes;
class AxesBase;
class Axes3D;

class Series;
class XYSeries;
class LineSeries;
class ScatterSeries;
class LineSeries3D;

class Camera;
class Logger;

class Toolkit;
class ToolkitRegistry;
class RenderContext;
class BackendResolver;
class ColorAssigner;
class Plotter;

class ImageExporter;
class SvgExporter;

struct Color;
struct Rect;
struct BoundingBox;
struct RenderConfig;
struct TubeMesh;
struct LineOptions;
struct ProjectionOptions;
struct CellOptions;

struct AxisStyle;
struct FigureStyle;

}   // namespace knotview
