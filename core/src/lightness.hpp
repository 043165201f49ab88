#pragma once

namespace tinge {
    // Maps Oklab lightness to a lightness estimate closer to CIELab's, keeping 0 and 1 fixed.
    // From https://bottosson.github.io/posts/colorpicker/#intermission---a-new-lightness-estimate-for-oklab
    float toe(float x);

    float toe_inv(float x);
}
