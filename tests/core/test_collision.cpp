/*
 * MintCrate Collision Tests
 *
 * Tests for shape construction, pure overlap/containment geometry, and the
 * flag-applying intersection tests.
 */

#include <catch2/catch_test_macros.hpp>
#include "mintcrate/collision.h"
#include "mintcrate/shape.h"
#include <cstring>

/* ============================================================================
 * Shape Construction
 * ============================================================================ */

TEST_CASE("Shape constructors", "[collision][shape]") {
    SECTION("None shape") {
        MintCrate_Shape s = mintcrate_shape_none();
        REQUIRE(s.kind == MINTCRATE_SHAPE_NONE);
        REQUIRE_FALSE(s.colliding);
        REQUIRE_FALSE(s.mouse_over);
    }

    SECTION("Rectangle carries size, no radius") {
        MintCrate_Shape s = mintcrate_shape_rect(1.0f, 2.0f, 3.0f, 4.0f);
        REQUIRE(s.kind == MINTCRATE_SHAPE_RECTANGLE);
        REQUIRE(s.x == 1.0f);
        REQUIRE(s.y == 2.0f);
        REQUIRE(s.w == 3.0f);
        REQUIRE(s.h == 4.0f);
        REQUIRE(s.r == 0.0f);
    }

    SECTION("Circle carries radius, no size") {
        MintCrate_Shape s = mintcrate_shape_circle(5.0f, 6.0f, 7.0f);
        REQUIRE(s.kind == MINTCRATE_SHAPE_CIRCLE);
        REQUIRE(s.r == 7.0f);
        REQUIRE(s.w == 0.0f);
        REQUIRE(s.h == 0.0f);
    }

    SECTION("Reset flags") {
        MintCrate_Shape s = mintcrate_shape_rect(0, 0, 1, 1);
        s.colliding = true;
        s.mouse_over = true;
        mintcrate_shape_reset_flags(&s);
        REQUIRE_FALSE(s.colliding);
        REQUIRE_FALSE(s.mouse_over);

        mintcrate_shape_reset_flags(nullptr);
    }

    SECTION("Kind names") {
        REQUIRE(strcmp(mintcrate_shape_kind_name(MINTCRATE_SHAPE_NONE), "none") == 0);
        REQUIRE(strcmp(mintcrate_shape_kind_name(MINTCRATE_SHAPE_RECTANGLE), "rectangle") == 0);
        REQUIRE(strcmp(mintcrate_shape_kind_name(MINTCRATE_SHAPE_CIRCLE), "circle") == 0);
    }
}

/* ============================================================================
 * Rectangle vs Rectangle
 * ============================================================================ */

TEST_CASE("Rectangle overlap", "[collision][rect]") {
    MintCrate_Shape a = mintcrate_shape_rect(0, 0, 10, 10);

    SECTION("Overlapping") {
        MintCrate_Shape b = mintcrate_shape_rect(5, 5, 10, 10);
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Contained") {
        MintCrate_Shape b = mintcrate_shape_rect(2, 2, 2, 2);
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &b));
        REQUIRE(mintcrate_collision_shapes_overlap(&b, &a));
    }

    SECTION("Edge-touching on X does not overlap") {
        MintCrate_Shape b = mintcrate_shape_rect(10, 0, 10, 10);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&b, &a));
    }

    SECTION("Edge-touching on Y does not overlap") {
        MintCrate_Shape b = mintcrate_shape_rect(0, 10, 10, 10);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Corner-touching does not overlap") {
        MintCrate_Shape b = mintcrate_shape_rect(10, 10, 5, 5);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Separated") {
        MintCrate_Shape b = mintcrate_shape_rect(50, 50, 10, 10);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Zero-area rectangle") {
        MintCrate_Shape b = mintcrate_shape_rect(5, 5, 0, 0);
        MintCrate_Shape on_edge = mintcrate_shape_rect(10, 5, 0, 0);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&b, &b));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &on_edge));
        /* Strictly inside a larger rectangle still counts as a point hit */
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &b));
    }
}

/* ============================================================================
 * Circle vs Circle
 * ============================================================================ */

TEST_CASE("Circle overlap", "[collision][circle]") {
    MintCrate_Shape a = mintcrate_shape_circle(0, 0, 5);

    SECTION("Overlapping") {
        MintCrate_Shape b = mintcrate_shape_circle(6, 0, 5);
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Distance equal to radius sum does not overlap") {
        MintCrate_Shape b = mintcrate_shape_circle(10, 0, 5);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&b, &a));
    }

    SECTION("Diagonal separation") {
        MintCrate_Shape b = mintcrate_shape_circle(8, 8, 5);
        // Distance ~11.31 > 10
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &b));
    }

    SECTION("Zero-radius circle behaves as a point") {
        MintCrate_Shape inside = mintcrate_shape_circle(3, 0, 0);
        MintCrate_Shape outside = mintcrate_shape_circle(5, 0, 0);
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &inside));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&a, &outside));
    }
}

/* ============================================================================
 * Rectangle vs Circle
 * ============================================================================ */

TEST_CASE("Rectangle and circle overlap", "[collision][mixed]") {
    SECTION("Circle near rectangle corner") {
        MintCrate_Shape circle = mintcrate_shape_circle(0, 0, 5);
        MintCrate_Shape rect = mintcrate_shape_rect(3, 3, 10, 10);
        // Nearest point (3,3), distance ~4.24
        REQUIRE(mintcrate_collision_shapes_overlap(&circle, &rect));
        REQUIRE(mintcrate_collision_shapes_overlap(&rect, &circle));
    }

    SECTION("Circle center inside rectangle") {
        MintCrate_Shape circle = mintcrate_shape_circle(5, 5, 1);
        MintCrate_Shape rect = mintcrate_shape_rect(0, 0, 10, 10);
        REQUIRE(mintcrate_collision_shapes_overlap(&circle, &rect));
    }

    SECTION("Circle out of reach") {
        MintCrate_Shape circle = mintcrate_shape_circle(0, 0, 5);
        MintCrate_Shape rect = mintcrate_shape_rect(4, 4, 10, 10);
        // Nearest point (4,4), distance ~5.66
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&circle, &rect));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&rect, &circle));
    }

    SECTION("Distance equal to radius counts as overlap") {
        MintCrate_Shape circle = mintcrate_shape_circle(5, 5, 5);
        MintCrate_Shape rect = mintcrate_shape_rect(10, 0, 10, 10);
        REQUIRE(mintcrate_collision_shapes_overlap(&circle, &rect));
        REQUIRE(mintcrate_collision_shapes_overlap(&rect, &circle));

        // The same spacing is a miss for circle/circle and rect/rect
        MintCrate_Shape other_circle = mintcrate_shape_circle(15, 5, 5);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&circle, &other_circle));

        MintCrate_Shape left = mintcrate_shape_rect(0, 0, 10, 10);
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&left, &rect));
    }
}

/* ============================================================================
 * None Shapes
 * ============================================================================ */

TEST_CASE("None shapes never collide", "[collision][none]") {
    MintCrate_Shape none = mintcrate_shape_none();
    MintCrate_Shape rect = mintcrate_shape_rect(0, 0, 10, 10);
    MintCrate_Shape circle = mintcrate_shape_circle(0, 0, 10);

    SECTION("Pure tests") {
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&none, &rect));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&rect, &none));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&none, &circle));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&circle, &none));
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(&none, &none));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(&none, 0, 0));
    }

    SECTION("Flag-applying tests do not mutate") {
        REQUIRE_FALSE(mintcrate_collision_intersects(&none, &rect));
        REQUIRE_FALSE(mintcrate_collision_intersects(&circle, &none));
        REQUIRE_FALSE(none.colliding);
        REQUIRE_FALSE(rect.colliding);
        REQUIRE_FALSE(circle.colliding);

        none.mouse_over = true;
        REQUIRE_FALSE(mintcrate_collision_contains_point(&none, 0, 0));
        REQUIRE(none.mouse_over);  // Untouched
    }

    SECTION("NULL shapes") {
        REQUIRE_FALSE(mintcrate_collision_shapes_overlap(nullptr, &rect));
        REQUIRE_FALSE(mintcrate_collision_intersects(&rect, nullptr));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(nullptr, 0, 0));
        REQUIRE_FALSE(mintcrate_collision_contains_point(nullptr, 0, 0));
        REQUIRE_FALSE(rect.colliding);
    }
}

/* ============================================================================
 * Symmetry
 * ============================================================================ */

TEST_CASE("Overlap is symmetric", "[collision][symmetry]") {
    const MintCrate_Shape shapes[] = {
        mintcrate_shape_none(),
        mintcrate_shape_rect(0, 0, 10, 10),
        mintcrate_shape_rect(10, 0, 10, 10),
        mintcrate_shape_rect(4, 4, 2, 2),
        mintcrate_shape_circle(0, 0, 5),
        mintcrate_shape_circle(10, 0, 5),
        mintcrate_shape_circle(25, 5, 5),
        mintcrate_shape_circle(14, 14, 3),
    };
    const int count = (int)(sizeof(shapes) / sizeof(shapes[0]));

    for (int i = 0; i < count; i++) {
        for (int j = 0; j < count; j++) {
            INFO("pair " << i << ", " << j);
            REQUIRE(mintcrate_collision_shapes_overlap(&shapes[i], &shapes[j]) ==
                    mintcrate_collision_shapes_overlap(&shapes[j], &shapes[i]));
        }
    }
}

/* ============================================================================
 * Flag-Applying Intersection
 * ============================================================================ */

TEST_CASE("Intersects sets colliding flags", "[collision][flags]") {
    SECTION("Hit marks both shapes") {
        MintCrate_Shape circle = mintcrate_shape_circle(0, 0, 5);
        MintCrate_Shape rect = mintcrate_shape_rect(3, 3, 10, 10);
        REQUIRE(mintcrate_collision_intersects(&circle, &rect));
        REQUIRE(circle.colliding);
        REQUIRE(rect.colliding);
        REQUIRE_FALSE(circle.mouse_over);
        REQUIRE_FALSE(rect.mouse_over);
    }

    SECTION("Miss leaves flags alone") {
        MintCrate_Shape a = mintcrate_shape_rect(0, 0, 10, 10);
        MintCrate_Shape b = mintcrate_shape_rect(10, 0, 10, 10);
        REQUIRE_FALSE(mintcrate_collision_intersects(&a, &b));
        REQUIRE_FALSE(a.colliding);
        REQUIRE_FALSE(b.colliding);
    }

    SECTION("Miss after a hit does not clear the flag") {
        MintCrate_Shape a = mintcrate_shape_rect(0, 0, 10, 10);
        MintCrate_Shape hit = mintcrate_shape_rect(5, 5, 10, 10);
        MintCrate_Shape miss = mintcrate_shape_rect(50, 50, 10, 10);

        REQUIRE(mintcrate_collision_intersects(&a, &hit));
        REQUIRE_FALSE(mintcrate_collision_intersects(&a, &miss));
        REQUIRE(a.colliding);
        REQUIRE(hit.colliding);
        REQUIRE_FALSE(miss.colliding);
    }

    SECTION("Pure test leaves flags alone") {
        MintCrate_Shape a = mintcrate_shape_rect(0, 0, 10, 10);
        MintCrate_Shape b = mintcrate_shape_rect(5, 5, 10, 10);
        REQUIRE(mintcrate_collision_shapes_overlap(&a, &b));
        REQUIRE_FALSE(a.colliding);
        REQUIRE_FALSE(b.colliding);
    }
}

/* ============================================================================
 * Point Containment
 * ============================================================================ */

TEST_CASE("Point containment", "[collision][point]") {
    SECTION("Rectangle is half-open") {
        MintCrate_Shape rect = mintcrate_shape_rect(0, 0, 10, 10);
        REQUIRE(mintcrate_collision_point_in_shape(&rect, 0, 0));
        REQUIRE(mintcrate_collision_point_in_shape(&rect, 9.5f, 9.5f));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(&rect, 10, 5));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(&rect, 5, 10));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(&rect, -0.5f, 5));
    }

    SECTION("Circle boundary is inside") {
        MintCrate_Shape circle = mintcrate_shape_circle(0, 0, 5);
        REQUIRE(mintcrate_collision_point_in_shape(&circle, 0, 0));
        REQUIRE(mintcrate_collision_point_in_shape(&circle, 5, 0));
        REQUIRE(mintcrate_collision_point_in_shape(&circle, 3, 4));
        REQUIRE_FALSE(mintcrate_collision_point_in_shape(&circle, 4, 4));
    }

    SECTION("Contains point stores the result as mouse_over") {
        MintCrate_Shape rect = mintcrate_shape_rect(0, 0, 10, 10);

        REQUIRE(mintcrate_collision_contains_point(&rect, 5, 5));
        REQUIRE(rect.mouse_over);

        // A later miss overwrites the flag
        REQUIRE_FALSE(mintcrate_collision_contains_point(&rect, 50, 50));
        REQUIRE_FALSE(rect.mouse_over);
        REQUIRE_FALSE(rect.colliding);
    }
}
