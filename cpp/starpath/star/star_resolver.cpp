#include "starpath/star/star_resolver.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace starpath {

namespace {

inline Direction invert(Direction d) noexcept {
    return d == Direction::Clockwise ? Direction::CounterClockwise : Direction::Clockwise;
}

// Angle of one vertex step, the polygon interior angle, both signed by winding.
inline double stepAngle(double sgn, std::uint32_t n) noexcept {
    return sgn * kTau / static_cast<double>(n);
}

inline double interiorAngle(double sgn, std::uint32_t n) noexcept {
    return sgn * (static_cast<double>(n) - 2.0) / static_cast<double>(n) * kPi;
}

void fillStellation(std::uint32_t n, std::uint32_t m, ResolvedGeometry& g) {
    const std::uint32_t d = std::gcd(n, m);
    g.stellations = d;
    g.verticesPerStellation = n / d;
}

} // namespace

std::uint32_t defaultStarStep(std::uint32_t vertices) noexcept {
    if (vertices < 3) return 1;
    return std::max<std::uint32_t>(1u, (vertices - 1) / 2);
}

StarError classifyStar(const StarSpec& spec, StarRequest& out, std::uint32_t maxVertices) {
    if (!std::isfinite(spec.radius)) return StarError::InvalidRadius;

    const std::int64_t maxN = static_cast<std::int64_t>(std::min(maxVertices, kMaxStarVertices));
    if (spec.vertices < static_cast<std::int64_t>(kMinStarVertices) || spec.vertices > maxN) {
        return StarError::InvalidVertexCount;
    }
    if (spec.step && spec.edgeLength) return StarError::InvalidArguments;

    StarRequest req;
    req.vertices = static_cast<std::uint32_t>(spec.vertices);
    req.direction = spec.radius >= 0.0 ? Direction::CounterClockwise : Direction::Clockwise;
    req.radius = std::abs(spec.radius);

    const std::int64_t n = spec.vertices;

    if (spec.edgeLength) {
        if (!std::isfinite(*spec.edgeLength)) return StarError::InvalidArguments;
        req.mode = StarMode::HullGiven;
        req.edgeLength = *spec.edgeLength;
        out = req;
        return StarError::Ok;
    }

    std::int64_t m = 0;
    if (!spec.step) {
        req.mode = StarMode::Internal;
        m = defaultStarStep(req.vertices);
    } else {
        const std::int64_t step = *spec.step;
        // Range check before negating so INT64_MIN cannot overflow.
        if (step < -(n - 1) || step > n - 1) return StarError::InvalidStep;
        req.mode = step >= 0 ? StarMode::Internal : StarMode::HullComputed;
        m = step >= 0 ? step : -step;
        if (m < 1) return StarError::InvalidStep;
    }

    if (2 * m > n) {
        m = n - m;
        if (req.mode == StarMode::HullComputed) req.direction = invert(req.direction);
    }
    req.step = static_cast<std::uint32_t>(m);
    out = req;
    return StarError::Ok;
}

StarError resolveStarGeometry(const StarRequest& request, ResolvedGeometry& out, double* minEdgeLength) {
    const std::uint32_t n = request.vertices;
    if (n < kMinStarVertices) return StarError::InvalidVertexCount;
    if (request.mode != StarMode::HullGiven && (request.step < 1 || request.step >= n)) {
        return StarError::InvalidStep;
    }

    const double sgn = directionSign(request.direction);
    const double m = static_cast<double>(request.step);

    ResolvedGeometry g;
    g.mode = request.mode;
    g.direction = request.direction;
    g.vertices = n;
    g.radius = request.radius;
    g.alpha = stepAngle(sgn, n);
    g.delta = interiorAngle(sgn, n);

    switch (request.mode) {
        case StarMode::Internal: {
            const double r = sgn * request.radius;
            g.step = request.step;
            g.beta = g.alpha * (m + 1.0) / 2.0;
            g.gamma = g.alpha * m;
            g.s = 2.0 * r * std::sin(g.alpha / 2.0);
            g.t = 2.0 * r * std::sin(g.gamma / 2.0);
            fillStellation(n, request.step, g);
            break;
        }
        case StarMode::HullComputed: {
            const double r = sgn * request.radius;
            g.step = request.step;
            g.gamma = g.alpha * m;
            g.theta = kPi - g.gamma;
            g.rho = (g.delta - g.theta) / 2.0;
            const double lambda = kPi - (g.alpha + g.theta) / 2.0;
            g.sigma = kPi - 2.0 * g.rho;
            g.u = std::sin(g.alpha / 2.0) * r / std::sin(lambda);
            fillStellation(n, request.step, g);
            break;
        }
        case StarMode::HullGiven: {
            // The radius magnitude is used; winding enters through alpha and delta only.
            const double r = request.radius;
            const double u = request.edgeLength;
            g.s = 2.0 * r * std::sin(g.alpha / 2.0);
            const double minU = std::abs(g.s) / 2.0;
            if (!(u > 0.0) || u < minU) {
                if (minEdgeLength) *minEdgeLength = minU;
                return StarError::EdgeTooShort;
            }
            const double c = std::clamp(g.s / (2.0 * u), -1.0, 1.0);
            g.rho = std::acos(c);
            g.theta = g.delta - 2.0 * g.rho;
            g.sigma = kPi - 2.0 * g.rho;
            g.u = u;
            g.verticesPerStellation = n;
            break;
        }
    }

    out = g;
    return StarError::Ok;
}

StarError resolveStar(const StarSpec& spec, ResolvedGeometry& out, double* minEdgeLength, std::uint32_t maxVertices) {
    StarRequest req;
    const StarError err = classifyStar(spec, req, maxVertices);
    if (err != StarError::Ok) return err;
    return resolveStarGeometry(req, out, minEdgeLength);
}

} // namespace starpath
