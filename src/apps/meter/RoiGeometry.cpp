#include "apps/meter/RoiGeometry.hpp"

namespace meter {

msg::Rect centeredRect(int cx, int cy, int w, int h) {
    msg::Rect r;
    r.x1 = cx - w / 2;
    r.y1 = cy - h / 2;
    r.x2 = r.x1 + w;
    r.y2 = r.y1 + h;
    return r;
}

SegmentRois segmentRois(const msg::Rect& digit_box, const SegmentGeometry& geo) {
    const int cx = (digit_box.x1 + digit_box.x2) / 2;
    const int cy = (digit_box.y1 + digit_box.y2) / 2;

    const int s = geo.SEG_SHORT;
    const int l = geo.SEG_LONG;

    SegmentRois rois{};
    // Horizontal strokes: long x short
    rois[0] = centeredRect(cx,                cy - geo.DY_OUTER, l, s); // a  top
    rois[3] = centeredRect(cx,                cy + geo.DY_OUTER, l, s); // d  bottom
    rois[6] = centeredRect(cx,                cy,                l, s); // g  middle

    // Vertical strokes: short x long
    rois[1] = centeredRect(cx + geo.DX_SIDE,  cy - geo.DY_SIDE,  s, l); // b  upper-right
    rois[2] = centeredRect(cx + geo.DX_SIDE,  cy + geo.DY_SIDE,  s, l); // c  lower-right
    rois[4] = centeredRect(cx - geo.DX_SIDE,  cy + geo.DY_SIDE,  s, l); // e  lower-left
    rois[5] = centeredRect(cx - geo.DX_SIDE,  cy - geo.DY_SIDE,  s, l); // f  upper-left

    return rois;
}

namespace {

bool insideFrame(const msg::Rect& r, uint32_t width, uint32_t height) {
    if (!r.valid()) return false;
    if (r.x1 < 0 || r.y1 < 0) return false;
    if (r.x2 > static_cast<int>(width))  return false;
    if (r.y2 > static_cast<int>(height)) return false;
    return true;
}

} // anonymous namespace

bool DisplayLayout::validate(uint32_t width, uint32_t height, std::string& why) const {
    if (SEGMENTS.SEG_SHORT < 1 || SEGMENTS.SEG_LONG < 1) {
        why = "segment size must be positive";
        return false;
    }

    for (std::size_t d = 0; d < msg::DIGIT_COUNT; ++d) {
        if (!insideFrame(DIGIT_BOXES[d], width, height)) {
            why = "digit box d" + std::to_string(d) + " outside frame";
            return false;
        }
        const SegmentRois segs = segmentRois(DIGIT_BOXES[d], SEGMENTS);
        for (std::size_t s = 0; s < msg::SEGMENT_COUNT; ++s) {
            if (!insideFrame(segs[s], width, height)) {
                why = "segment " + std::string(1, msg::segmentName(s)) +
                      " of digit d" + std::to_string(d) + " outside frame";
                return false;
            }
        }
    }

    for (std::size_t i = 0; i < msg::DOT_COUNT; ++i) {
        if (!insideFrame(DOT_BOXES[i], width, height)) {
            why = std::string("dot ") + msg::dotName(static_cast<msg::DotId>(i)) + " outside frame";
            return false;
        }
    }

    for (std::size_t i = 0; i < msg::MODE_COUNT; ++i) {
        if (!insideFrame(MODE_BOXES[i], width, height)) {
            why = std::string("mode ") + msg::modeName(static_cast<msg::ModeId>(i)) + " outside frame";
            return false;
        }
    }

    why.clear();
    return true;
}

} // namespace meter
