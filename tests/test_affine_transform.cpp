#include <catch2/catch_all.hpp>
#include "../documents/svg/stx_affine_transform.h"
#include "../utils/stx_exceptions.h"

using Catch::Approx;

SCENARIO("stx_affine_transform composes and maps points") {
    GIVEN("The identity and an arbitrary transform") {
        stx_affine_transform id = stx_affine_transform::identity();
        stx_affine_transform t = stx_affine_transform::matrix(2, 0.5, -1, 3, 7, -4);

        THEN("Composing with the identity on either side is a no-op") {
            REQUIRE(stx_affine_transform::compose(id, t) == t);
            REQUIRE(stx_affine_transform::compose(t, id) == t);
            REQUIRE(id * t == t);
        }
    }

    GIVEN("translate(5,5) followed by scale(2,2)") {
        stx_affine_transform t = stx_affine_transform::identity().translate(5, 5).scale(2, 2);

        THEN("The origin maps to (5,5)") {
            stx_point p = t.apply_to_point(stx_point(0, 0));
            REQUIRE(p.x == Approx(5.0));
            REQUIRE(p.y == Approx(5.0));
        }
        THEN("(1,0) maps to (7,5)") {
            stx_point p = t.apply_to_point(stx_point(1, 0));
            REQUIRE(p.x == Approx(7.0));
            REQUIRE(p.y == Approx(5.0));
        }
    }

    GIVEN("Two parsed transforms composed outer to inner") {
        stx_affine_transform outer = stx_affine_transform::parse("translate(5,5)");
        stx_affine_transform inner = stx_affine_transform::parse("scale(2)");
        stx_affine_transform t = stx_affine_transform::compose(outer, inner);

        THEN("The inner transform is applied first") {
            stx_point p = t.apply_to_point(stx_point(1, 1));
            REQUIRE(p.x == Approx(7.0));
            REQUIRE(p.y == Approx(7.0));
        }
    }
}

SCENARIO("stx_affine_transform extracts the rotation angle") {
    GIVEN("A pure translation") {
        stx_affine_transform t = stx_affine_transform::identity().translate(12, -3);
        THEN("The rotation is zero") {
            REQUIRE(t.get_rotation_degrees() == 0.0);
        }
    }

    GIVEN("A rotation by 30 degrees with uniform scale") {
        stx_affine_transform t = stx_affine_transform::identity().scale(3).rotate_degrees(30);
        THEN("The angle is recovered") {
            REQUIRE(t.get_rotation_degrees() == Approx(30.0));
        }
    }

    GIVEN("A rotation about a center point") {
        stx_affine_transform t = stx_affine_transform::parse("rotate(90, 10, 10)");
        THEN("The center is fixed") {
            stx_point c = t.apply_to_point(stx_point(10, 10));
            REQUIRE(c.x == Approx(10.0));
            REQUIRE(c.y == Approx(10.0));
        }
        THEN("Other points turn around it") {
            stx_point p = t.apply_to_point(stx_point(20, 10));
            REQUIRE(p.x == Approx(10.0));
            REQUIRE(p.y == Approx(20.0));
            REQUIRE(t.get_rotation_degrees() == Approx(90.0));
        }
    }
}

SCENARIO("stx_affine_transform parses transform attributes") {
    GIVEN("Supported transform functions") {
        THEN("matrix takes six arguments separated by commas or spaces") {
            stx_affine_transform t = stx_affine_transform::parse("matrix(1 0, 0 1,  4,-2)");
            REQUIRE(t == stx_affine_transform::matrix(1, 0, 0, 1, 4, -2));
        }
        THEN("translate defaults ty to zero") {
            stx_affine_transform t = stx_affine_transform::parse("translate(3)");
            REQUIRE(t == stx_affine_transform::matrix(1, 0, 0, 1, 3, 0));
        }
        THEN("scale with one argument is uniform") {
            stx_affine_transform t = stx_affine_transform::parse(" scale( 2.5 ) ");
            REQUIRE(t == stx_affine_transform::matrix(2.5, 0, 0, 2.5, 0, 0));
        }
        THEN("Exponent notation is accepted") {
            stx_affine_transform t = stx_affine_transform::parse("translate(1e1,-2E0)");
            REQUIRE(t == stx_affine_transform::matrix(1, 0, 0, 1, 10, -2));
        }
    }

    GIVEN("An unsupported function") {
        THEN("skewX raises a parse error naming the attribute") {
            REQUIRE_THROWS_AS(stx_affine_transform::parse("skewX(10)"), stx_parse_error);
            try {
                stx_affine_transform::parse("skewX(10)");
            } catch (const stx_parse_error& e) {
                REQUIRE(e.get_attribute() == "skewX(10)");
                REQUIRE(stx_string(e.what()).contains("skewX(10)"));
            }
        }
    }

    GIVEN("Wrong argument counts or malformed text") {
        THEN("Each one is a parse error") {
            REQUIRE_THROWS_AS(stx_affine_transform::parse("matrix(1,0,0,1,0)"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("translate()"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("scale(1,2,3)"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("rotate(10,5)"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("translate(a,b)"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("translate(1,2"), stx_parse_error);
            REQUIRE_THROWS_AS(stx_affine_transform::parse("translate(1) scale(2)"), stx_parse_error);
        }
    }
}
