#include <catch2/catch_all.hpp>
#include "../documents/svg/stx_svg_text_extractor.h"
#include "../utils/stx_exceptions.h"

using Catch::Approx;

namespace {

  stx_svg_document parsed(const char* svg) {
    stx_svg_document document;
    REQUIRE(document.parse(svg));
    return document;
  }

  const stx_styled_label& styled(const stx_extraction_result& result, size_t i) {
    const stx_styled_label* label = dynamic_cast<const stx_styled_label*>(result.labels[i].get());
    REQUIRE(label != nullptr);
    return *label;
  }

  stx_string residual_text(const stx_extraction_result& result) {
    stx_string data;
    REQUIRE(result.residual->serialize(data));
    return data;
  }

}

SCENARIO("A red 12px run inside a translated group") {
    GIVEN("A one inch document") {
        stx_svg_document document = parsed(R"(<?xml version="1.0"?>
<svg xmlns="http://www.w3.org/2000/svg" id="svg1" width="96" height="96">
  <rect id="frame" x="0" y="0" width="96" height="96"/>
  <g transform="translate(5,5)">
    <text id="text1" style="font-size:12px"><tspan x="10" y="20" style="fill:#ff0000">Hello</tspan></text>
  </g>
</svg>)");

        WHEN("Text is extracted") {
            stx_svg_text_extractor extractor(stx_style_tables::defaults());
            stx_extraction_result result = extractor.extract(document);

            THEN("One styled label sits at the mapped anchor") {
                REQUIRE(result.labels.size() == 1);
                const stx_styled_label& label = styled(result, 0);
                REQUIRE(label.pos.x == Approx(15.0));
                REQUIRE(label.pos.y == Approx(25.0));
                REQUIRE(label.angle == 0.0);
                REQUIRE(label.color == stx_rgb_color(255, 0, 0));
                REQUIRE(label.font_size == "\\normalsize");
                REQUIRE(label.texcode() == "\\rmfamily\\normalsize\\color[RGB]{255,0,0}\\makebox(0,0)[bl]{\\smash{Hello}}");
            }

            THEN("The text element is consumed and removed from the residual copy only") {
                REQUIRE(result.residual->consumed_ids.count("text1") == 1);
                stx_string residual = residual_text(result);
                REQUIRE(!residual.contains("<text"));
                REQUIRE(residual.contains("id=\"frame\""));
                REQUIRE(residual.contains("translate(5,5)"));

                stx_string source;
                REQUIRE(document.serialize(source));
                REQUIRE(source.contains("<text"));
            }
        }
    }
}

SCENARIO("Runs are folded into one label") {
    GIVEN("A text element with two styled runs and an empty run") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100">
  <text id="t" x="3" y="4" font-family="CMU Typewriter Text" fill="#00ff00">
    <tspan x="1" y="2" style="fill:#ff0000">A</tspan>
    <tspan x="50" y="60" style="font-weight:bold">B</tspan>
    <tspan/>
  </text>
</svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults());
        stx_extraction_result result = extractor.extract(document);

        THEN("Position comes from the first run, style from the last one") {
            REQUIRE(result.labels.size() == 1);
            const stx_styled_label& label = styled(result, 0);
            REQUIRE(label.text == "A B");
            REQUIRE(label.pos == stx_point(1, 2));
            REQUIRE(label.font_weight == 500);
            REQUIRE(label.color == stx_rgb_color(0, 255, 0));
            REQUIRE(label.font_family == "tt");
        }
    }

    GIVEN("A run without coordinates and a text without runs") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100">
  <text id="a" x="7 9 11" y="8"><tspan>inherits</tspan></text>
  <text transform="rotate(30)">Rot</text>
</svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults());
        stx_extraction_result result = extractor.extract(document);

        THEN("The run takes the first text coordinate") {
            REQUIRE(result.labels.size() == 2);
            REQUIRE(styled(result, 0).pos == stx_point(7, 8));
            REQUIRE(styled(result, 0).text == "inherits");
        }
        THEN("Character data forms a single run and the rotation is negated") {
            const stx_styled_label& label = styled(result, 1);
            REQUIRE(label.text == "Rot");
            REQUIRE(label.angle == Approx(-30.0));
            REQUIRE(label.pos.x == Approx(0.0));
        }
        THEN("Elements without id are converted but not recorded") {
            REQUIRE(result.residual->consumed_ids.size() == 1);
            REQUIRE(!residual_text(result).contains("Rot"));
        }
    }
}

SCENARIO("Unmapped style values warn instead of failing") {
    GIVEN("A text in Comic Sans") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100">
  <text id="c" x="1" y="1" style="font-family:'Comic Sans'">Hi</text>
</svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults());
        stx_extraction_result result = extractor.extract(document);

        THEN("The family stays rm and one warning names the element") {
            REQUIRE(styled(result, 0).font_family == "rm");
            REQUIRE(result.warnings.size() == 1);
            REQUIRE(result.warnings[0].element_id == "c");
        }
    }

    GIVEN("Two texts of several runs sharing an unmapped family") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100">
  <text id="a" style="font-family:Papyrus"><tspan x="1" y="1">one</tspan><tspan>two</tspan><tspan>three</tspan></text>
  <text id="b" style="font-family:Papyrus"><tspan x="1" y="9">four</tspan><tspan>five</tspan></text>
</svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults());
        stx_extraction_result result = extractor.extract(document);

        THEN("Each element reports the miss once") {
            REQUIRE(result.warnings.size() == 2);
            REQUIRE(result.warnings[0].element_id == "a");
            REQUIRE(result.warnings[0].key == "font-family");
            REQUIRE(result.warnings[1].element_id == "b");
        }
    }
}

SCENARIO("Fatal attribute errors abort the extraction") {
    stx_svg_text_extractor extractor(stx_style_tables::defaults());

    GIVEN("An unsupported transform on an ancestor") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="10" height="10">
  <g transform="skewX(10)"><text x="1" y="1">t</text></g>
</svg>)");
        THEN("A parse error is raised") {
            REQUIRE_THROWS_AS(extractor.extract(document), stx_parse_error);
        }
    }

    GIVEN("A named fill color") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="10" height="10">
  <text x="1" y="1" fill="red">t</text>
</svg>)");
        THEN("The color format is rejected") {
            REQUIRE_THROWS_AS(extractor.extract(document), stx_unsupported_color_format);
        }
    }
}

SCENARIO("Definitions, opaque markup and prefixed elements") {
    GIVEN("A document with defs, a textext group and a pattern") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" xmlns:textext="http://www.iki.fi/pav/software/textext/"
     width="100" height="100">
  <defs id="defs1">
    <path id="p1" d="M0 0"/>
    <linearGradient id="g1"><stop id="s1"/></linearGradient>
  </defs>
  <pattern id="pat"><rect id="r1"/></pattern>
  <g id="tex1" transform="translate(10,0)" textext:text="$\\beta$\n\x41">
    <use x="2" y="30"/>
    <g><use x="5" y="40"/></g>
  </g>
  <g id="tex2" textext:text="plain"/>
  <circle id="dot" r="3"/>
</svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults(), 96.0);
        stx_extraction_result result = extractor.extract(document);

        THEN("Ids inside defs and pattern are ignored") {
            const std::set<stx_string>& ignored = result.residual->ignored_ids;
            REQUIRE(ignored.size() == 4);
            REQUIRE(ignored.count("p1") == 1);
            REQUIRE(ignored.count("g1") == 1);
            REQUIRE(ignored.count("s1") == 1);
            REQUIRE(ignored.count("r1") == 1);
            REQUIRE(ignored.count("defs1") == 0);
        }

        THEN("Opaque groups become scaled labels anchored at min x / max y") {
            REQUIRE(result.labels.size() == 2);
            const stx_opaque_label* first = dynamic_cast<const stx_opaque_label*>(result.labels[0].get());
            REQUIRE(first != nullptr);
            REQUIRE(first->code == "$\\beta$\nA");
            REQUIRE(first->pos.x == Approx(12.0));
            REQUIRE(first->pos.y == Approx(40.0));
            REQUIRE(first->scale_factor == Approx(0.75));

            const stx_opaque_label* second = dynamic_cast<const stx_opaque_label*>(result.labels[1].get());
            REQUIRE(second != nullptr);
            REQUIRE(second->pos == stx_point(0, 0));
        }

        THEN("Opaque groups are consumed and stripped") {
            REQUIRE(result.residual->consumed_ids.count("tex1") == 1);
            REQUIRE(result.residual->consumed_ids.count("tex2") == 1);
            stx_string residual = residual_text(result);
            REQUIRE(!residual.contains("tex1"));
            REQUIRE(residual.contains("id=\"dot\""));
        }
    }

    GIVEN("A document using an svg prefix") {
        stx_svg_document document = parsed(R"(
<svg:svg xmlns:svg="http://www.w3.org/2000/svg" width="10" height="10">
  <svg:text id="t" x="2" y="3"><svg:tspan>prefixed</svg:tspan></svg:text>
  <text xmlns="http://example.com/other" id="foreign">not svg</text>
</svg:svg>)");

        stx_svg_text_extractor extractor(stx_style_tables::defaults());
        stx_extraction_result result = extractor.extract(document);

        THEN("Only elements in the SVG namespace are converted") {
            REQUIRE(result.labels.size() == 1);
            REQUIRE(styled(result, 0).text == "prefixed");
            REQUIRE(residual_text(result).contains("foreign"));
        }
    }
}

SCENARIO("Opaque markup escapes are decoded") {
    THEN("Simple escapes") {
        REQUIRE(stx_svg_text_extractor::decode_escapes("a\\\\b\\'\\\"\\t") == "a\\b'\"\t");
    }
    THEN("Numeric escapes become UTF-8") {
        REQUIRE(stx_svg_text_extractor::decode_escapes("\\101\\x42") == "AB");
        REQUIRE(stx_svg_text_extractor::decode_escapes("\\u00e9") == "\xc3\xa9");
        REQUIRE(stx_svg_text_extractor::decode_escapes("\\U0001F600") == "\xf0\x9f\x98\x80");
    }
    THEN("Unknown or malformed escapes are kept") {
        REQUIRE(stx_svg_text_extractor::decode_escapes("\\q\\xZZ\\ud800x\\") == "\\q\\xZZ\\ud800x\\");
    }
}

SCENARIO("Ancestor transforms accumulate outward") {
    GIVEN("Nested groups") {
        stx_svg_document document = parsed(R"(
<svg xmlns="http://www.w3.org/2000/svg" width="10" height="10">
  <g transform="translate(5,5)"><g transform="scale(2)"><rect id="r" transform="translate(1,0)"/></g></g>
</svg>)");
        pugi::xml_node rect = document.root().first_child().first_child().first_child();

        THEN("The node transform is applied first") {
            stx_point p = stx_svg_text_extractor::accumulated_transform(rect).apply_to_point(stx_point(0, 0));
            REQUIRE(p.x == Approx(7.0));
            REQUIRE(p.y == Approx(5.0));
        }
    }
}
