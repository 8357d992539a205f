#include <catch2/catch_all.hpp>
#include "../documents/stx_layout_to_latex.h"
#include "../utils/stx_exceptions.h"

namespace {

  stx_canonical_frame frame_of(double x_min, double x_max, double y_min, double y_max) {
    stx_canonical_frame frame;
    frame.x_min = x_min;
    frame.x_max = x_max;
    frame.y_min = y_min;
    frame.y_max = y_max;
    return frame;
  }

}

SCENARIO("stx_layout_to_latex writes a normalized picture") {
    GIVEN("A 100 x 50 frame, a cropped background and two labels") {
        stx_canonical_frame frame = frame_of(0, 100, 0, 50);
        stx_layout_bounds pdf_box(10, 10, 80, 30);

        std::vector<std::unique_ptr<stx_label>> labels;
        labels.push_back(std::unique_ptr<stx_label>(new stx_styled_label(stx_point(15, 25), "Hello")));
        labels.push_back(std::unique_ptr<stx_label>(new stx_opaque_label(stx_point(100, 50), "$x$", 0.75)));

        stx_layout_to_latex emitter;
        stx_string tex = emitter.convert_to_picture(frame, pdf_box, "drawing.pdf", labels);

        THEN("The block is wrapped in a group with the preamble") {
            REQUIRE(tex.starts_with("\\begingroup%\n% Picture generated by svgtex\n"));
            REQUIRE(tex.ends_with("\\end{picture}%\n\\endgroup%\n"));
            REQUIRE(tex.contains("\\providecommand\\color[2][]{%"));
            REQUIRE(tex.contains("\\providecommand\\transparent[1]{%"));
        }
        THEN("The unit length falls back to the frame width in bp") {
            REQUIRE(tex.contains("\\ifx\\svgwidth\\undefined%\n  \\setlength{\\unitlength}{75.0bp}%\n"));
            REQUIRE(tex.contains("\\setlength{\\unitlength}{\\svgwidth}%"));
            REQUIRE(tex.contains("\\global\\let\\svgwidth\\undefined%"));
        }
        THEN("The picture is one unit wide") {
            REQUIRE(tex.contains("\\begin{picture}(1.0, 0.5)%\n"));
        }
        THEN("The background is placed at its lower left corner and scaled") {
            REQUIRE(tex.contains("\\put(0.1, 0.1){\\includegraphics[width=0.8\\unitlength]{drawing.pdf}}%\n"));
        }
        THEN("Labels are flipped and normalized") {
            REQUIRE(tex.contains("\\put(0.15, 0.25){\\rmfamily\\makebox(0,0)[bl]{\\smash{Hello}}}%\n"));
            REQUIRE(tex.contains("\\put(1.0, 0.0){\\scalebox{0.75}{\\makebox(0,0)[bl]{%\n$x$%\n}}}%\n"));
        }
        THEN("Puts come in background, label order") {
            REQUIRE(tex.find("includegraphics") < tex.find("Hello"));
            REQUIRE(tex.find("Hello") < tex.find("$x$"));
        }
    }

    GIVEN("A frame that does not start at the origin") {
        stx_canonical_frame frame = frame_of(-20, 60, 10, 50);
        std::vector<std::unique_ptr<stx_label>> labels;
        labels.push_back(std::unique_ptr<stx_label>(new stx_styled_label(stx_point(-20, 10), "corner")));

        stx_layout_to_latex emitter;
        stx_string tex = emitter.convert_to_picture(frame, stx_layout_bounds(-20, 10, 80, 40), "bg.pdf", labels);

        THEN("The top left frame corner maps to (0, height)") {
            REQUIRE(tex.contains("\\begin{picture}(1.0, 0.5)%"));
            REQUIRE(tex.contains("\\put(0.0, 0.5){\\rmfamily"));
            REQUIRE(tex.contains("\\put(0.0, 0.0){\\includegraphics[width=1.0\\unitlength]{bg.pdf}}%"));
        }
    }

    GIVEN("A degenerate frame") {
        stx_layout_to_latex emitter;
        std::vector<std::unique_ptr<stx_label>> labels;

        THEN("The width self check fails") {
            REQUIRE_THROWS_AS(emitter.convert_to_picture(frame_of(5, 5, 0, 10), stx_layout_bounds(), "bg.pdf", labels),
                              stx_reconciliation_error);
        }
    }
}
