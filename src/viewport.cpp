#include "g2d/viewport.hpp"

namespace g2d {

Matrix2d identity() {
    return {{{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}}};
}

Matrix2d absTransform(f64 w, f64 h) {
    const f64 sx = 2.0 / w;
    const f64 sy = -2.0 / h;
    return {{{sx, 0.0, -1.0}, {0.0, sy, 1.0}}};
}

Matrix2d multiply(const Matrix2d& a, const Matrix2d& b) {
    Matrix2d m;
    for (int r = 0; r < 2; ++r) {
        m[r][0] = a[r][0] * b[0][0] + a[r][1] * b[1][0];
        m[r][1] = a[r][0] * b[0][1] + a[r][1] * b[1][1];
        m[r][2] = a[r][0] * b[0][2] + a[r][1] * b[1][2] + a[r][2];
    }
    return m;
}

Context Context::NewViewport(const Viewport& viewport) {
    Context c;
    c.viewport = viewport;
    c.view = absTransform(viewport.windowSize[0], viewport.windowSize[1]);
    c.transform = c.view;
    return c;
}

Context Context::NewAbs(f64 w, f64 h) {
    Context c;
    c.view = absTransform(w, h);
    c.transform = c.view;
    return c;
}

Context Context::trans(f64 x, f64 y) const {
    Context c = *this;
    c.transform = multiply(transform, {{{1.0, 0.0, x}, {0.0, 1.0, y}}});
    return c;
}

Context Context::scale(f64 sx, f64 sy) const {
    Context c = *this;
    c.transform = multiply(transform, {{{sx, 0.0, 0.0}, {0.0, sy, 0.0}}});
    return c;
}

void Context::transformPoint(f64 x, f64 y, f32 out[2]) const {
    out[0] = f32(transform[0][0] * x + transform[0][1] * y + transform[0][2]);
    out[1] = f32(transform[1][0] * x + transform[1][1] * y + transform[1][2]);
}

} // namespace g2d
