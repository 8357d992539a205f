#include <catch2/catch_all.hpp>
#include "../documents/svg/stx_svg_style.h"
#include "../utils/stx_exceptions.h"

SCENARIO("Style strings are parsed and merged") {
    GIVEN("A style attribute with duplicates and padding") {
        stx_style_map style = parse_style_string(" fill : #ff0000 ;font-size:12px; fill:#00ff00;; ");

        THEN("Keys and values are trimmed and the last duplicate wins") {
            REQUIRE(style.size() == 2);
            REQUIRE(style["fill"] == "#00ff00");
            REQUIRE(style["font-size"] == "12px");
        }
    }

    GIVEN("A parent and a child style") {
        stx_style_map parent = parse_style_string("fill:#000000;font-size:10px");
        stx_style_map child = parse_style_string("font-size:12px;font-weight:bold");
        stx_style_map merged = merge_styles(parent, child);

        THEN("Child keys override, parent keys stay") {
            REQUIRE(merged["fill"] == "#000000");
            REQUIRE(merged["font-size"] == "12px");
            REQUIRE(merged["font-weight"] == "bold");
            REQUIRE(parent["font-size"] == "10px");
        }
    }
}

SCENARIO("Color and weight values are decoded") {
    THEN("Hex triplets decode to RGB") {
        stx_rgb_color c = parse_svg_color("#ff8000");
        REQUIRE(c.r == 255);
        REQUIRE(c.g == 128);
        REQUIRE(c.b == 0);
        REQUIRE(parse_svg_color("#000000").is_black());
    }
    THEN("Other color forms are rejected") {
        REQUIRE_THROWS_AS(parse_svg_color("red"), stx_unsupported_color_format);
        REQUIRE_THROWS_AS(parse_svg_color("#f00"), stx_unsupported_color_format);
        REQUIRE_THROWS_AS(parse_svg_color("rgb(1,2,3)"), stx_unsupported_color_format);
        REQUIRE_THROWS_AS(parse_svg_color("#gg0000"), stx_unsupported_color_format);
        try {
            parse_svg_color("hsl(0,100%,50%)");
            FAIL("parse_svg_color should have thrown");
        } catch (const stx_unsupported_color_format& e) {
            REQUIRE(e.get_value() == "hsl(0,100%,50%)");
        }
    }
    THEN("Weights map bold, normal and integers") {
        REQUIRE(parse_font_weight("bold") == 700);
        REQUIRE(parse_font_weight("normal") == 500);
        REQUIRE(parse_font_weight("300") == 300);
        REQUIRE_THROWS_AS(parse_font_weight("heavy"), stx_invalid_weight);
        REQUIRE_THROWS_AS(parse_font_weight("700px"), stx_invalid_weight);
        try {
            parse_font_weight("heavy");
            FAIL("parse_font_weight should have thrown");
        } catch (const stx_invalid_weight& e) {
            REQUIRE(e.get_value() == "heavy");
        }
    }
}

SCENARIO("stx_svg_style_resolver applies styles to a label") {
    GIVEN("The default tables") {
        stx_svg_style_resolver resolver(stx_style_tables::defaults());

        WHEN("A fully mapped style is applied") {
            stx_styled_label label;
            resolver.apply(parse_style_string(
                "fill:#ff0000;font-weight:bold;font-style:italic;text-anchor:middle;"
                "font-family:'CMU Sans Serif';font-size:12px"), label, "text1");

            THEN("Every field is set and no warning is recorded") {
                REQUIRE(label.color == stx_rgb_color(255, 0, 0));
                REQUIRE(label.font_weight == 700);
                REQUIRE(label.font_style == stx_font_style::italic);
                REQUIRE(label.align == stx_text_align::center);
                REQUIRE(label.font_family == "sf");
                REQUIRE(label.font_size == "\\normalsize");
                REQUIRE(resolver.get_warnings().empty());
            }
        }

        WHEN("The family is not in the table") {
            stx_styled_label label;
            resolver.apply(parse_style_string("font-family:Comic Sans"), label, "text7");

            THEN("The family stays at its default and a warning is recorded") {
                REQUIRE(label.font_family == "rm");
                REQUIRE(resolver.get_warnings().size() == 1);
                REQUIRE(resolver.get_warnings()[0].key == "font-family");
                REQUIRE(resolver.get_warnings()[0].value == "Comic Sans");
                REQUIRE(resolver.get_warnings()[0].element_id == "text7");
            }
        }

        WHEN("The size is not in the table") {
            stx_styled_label label;
            resolver.apply(parse_style_string("font-size:40px"), label);

            THEN("No size command is set and a warning is recorded") {
                REQUIRE(label.font_size.empty());
                REQUIRE(resolver.get_warnings().size() == 1);
            }
        }

        WHEN("Font style and anchor values are unknown") {
            stx_styled_label label;
            label.align = stx_text_align::right;
            resolver.apply(parse_style_string("font-style:wavy;text-anchor:justify"), label);

            THEN("The previous values are kept without a warning") {
                REQUIRE(label.font_style == stx_font_style::normal);
                REQUIRE(label.align == stx_text_align::right);
                REQUIRE(resolver.get_warnings().empty());
            }
        }

        WHEN("The fill is a named color") {
            stx_styled_label label;
            THEN("Conversion fails") {
                REQUIRE_THROWS_AS(resolver.apply(parse_style_string("fill:red"), label), stx_unsupported_color_format);
            }
        }
    }

    GIVEN("Tables extended from configuration entries") {
        stx_style_tables tables = stx_style_tables::defaults();
        stx_style_tables::add_entries(tables.font_families, "Comic Sans=sf; Broken ; =x");
        stx_svg_style_resolver resolver(tables);

        THEN("The new family resolves") {
            stx_styled_label label;
            resolver.apply(parse_style_string("font-family:Comic Sans"), label);
            REQUIRE(label.font_family == "sf");
            REQUIRE(resolver.get_warnings().empty());
            REQUIRE(tables.font_families.size() == 5);
        }
    }
}
