#include <gtest/gtest.h>
#include "geometry.hpp"
#include "test_helpers.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <vector>

using namespace bowtiemodel;
using namespace bowtiemodel::test;

// ============================================
// Centered free-space bowtie
// ============================================

TEST(BowtieBuilderTest, CenteredScenario) {
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(),
                                    default_bowtie(), Placement::centered());

    expect_vec_near(g.feed_point, {0.1, 0.1, 0.05});

    // Wing 1 extends toward +x, shifted one cell away from the feed
    expect_vec_near(g.wings[0].vertices[0], {0.101, 0.05, 0.05});
    expect_vec_near(g.wings[0].vertices[1], {0.101, 0.15, 0.05});
    expect_vec_near(g.wings[0].vertices[2], {0.151, 0.1, 0.05});

    // Wing 2 mirrors it toward -x
    expect_vec_near(g.wings[1].vertices[0], {0.099, 0.05, 0.05});
    expect_vec_near(g.wings[1].vertices[1], {0.099, 0.15, 0.05});
    expect_vec_near(g.wings[1].vertices[2], {0.049, 0.1, 0.05});

    EXPECT_FALSE(g.probe_point.has_value());
    for (const auto& wing : g.wings) {
        EXPECT_DOUBLE_EQ(wing.thickness, 0.0);
        EXPECT_EQ(wing.material, "pec");
    }
}

TEST(BowtieBuilderTest, DetailViewScenario) {
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(),
                                    default_bowtie(), Placement::centered());

    expect_vec_near(g.detail_view.min_corner, {0.047, 0.048, 0.048});
    expect_vec_near(g.detail_view.max_corner, {0.153, 0.152, 0.052});
    expect_vec_near(g.detail_view.step, {0.001, 0.001, 0.001});
    EXPECT_EQ(g.detail_view.id, "bowtie_detail");
    EXPECT_EQ(g.detail_view.mode, ViewMode::Fine);
}

TEST(BowtieBuilderTest, FullViewCoversDomain) {
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(),
                                    default_bowtie(), Placement::centered());

    EXPECT_EQ(g.full_view.min_corner, vec3::zero());
    expect_vec_near(g.full_view.max_corner, {0.2, 0.2, 0.1});
    expect_vec_near(g.full_view.step, {0.001, 0.001, 0.001});
    EXPECT_EQ(g.full_view.id, "bowtie_full");
    EXPECT_EQ(g.full_view.mode, ViewMode::Coarse);
    EXPECT_NE(g.full_view.id, g.detail_view.id);
}

TEST(BowtieBuilderTest, ViewPrefixNamesBothViews) {
    Placement p = Placement::centered();
    p.view_prefix = "run7";
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(), default_bowtie(), p);
    EXPECT_EQ(g.full_view.id, "run7_full");
    EXPECT_EQ(g.detail_view.id, "run7_detail");
}

// ============================================
// Ground-offset bowtie with receiver
// ============================================

TEST(BowtieBuilderTest, GroundOffsetScenario) {
    Domain domain{0.2, 0.12, 0.12};
    BowtieGeometry g = build_bowtie(domain, default_spacing(), default_bowtie(),
                                    Placement::ground_offset(0.02));

    expect_vec_near(g.feed_point, {0.1, 0.06, 0.02});
    ASSERT_TRUE(g.probe_point.has_value());
    expect_vec_near(*g.probe_point, {0.1, 0.06, 0.04});

    for (const auto& wing : g.wings) {
        for (const auto& v : wing.vertices) {
            EXPECT_NEAR(v.z, 0.02, TOLERANCE);
        }
    }
}

// ============================================
// Properties over a range of inputs
// ============================================

namespace {

struct Case {
    Domain domain;
    GridSpacing spacing;
    BowtieSpec bowtie;
};

std::vector<Case> property_cases() {
    return {
        {{0.2, 0.2, 0.1}, {0.001, 0.001, 0.001}, {0.05, 0.1}},
        {{0.3, 0.25, 0.2}, {0.002, 0.001, 0.0005}, {0.08, 0.05}},
        {{1.0, 1.0, 1.0}, {0.01, 0.02, 0.01}, {0.3, 0.4}},
        {{0.05, 0.05, 0.05}, {0.0005, 0.0005, 0.0005}, {0.01, 0.003}},
    };
}

}  // namespace

TEST(BowtieBuilderTest, WingsAreMirrorImages) {
    for (const auto& c : property_cases()) {
        BowtieGeometry g = build_bowtie(c.domain, c.spacing, c.bowtie, Placement::centered());
        for (size_t k = 0; k < 3; ++k) {
            Vec3 mirrored = reflect_x(g.wings[0].vertices[k], g.feed_point.x);
            EXPECT_TRUE(approx_equal(mirrored, g.wings[1].vertices[k], 1e-12))
                << "vertex " << k << " of domain " << c.domain.x;
        }
    }
}

TEST(BowtieBuilderTest, NoVertexWithinOneCellOfFeed) {
    for (const auto& c : property_cases()) {
        BowtieGeometry g = build_bowtie(c.domain, c.spacing, c.bowtie, Placement::centered());
        double min_step = std::min({c.spacing.dx, c.spacing.dy, c.spacing.dz});
        for (const auto& wing : g.wings) {
            for (const auto& v : wing.vertices) {
                EXPECT_GE(v.distance_to(g.feed_point), min_step);
            }
        }
    }
}

TEST(BowtieBuilderTest, DetailViewPadsAntennaByTwoCells) {
    for (const auto& c : property_cases()) {
        BowtieGeometry g = build_bowtie(c.domain, c.spacing, c.bowtie, Placement::centered());
        Vec3 padding = c.spacing.step() * 2.0;

        expect_vec_near(g.detail_view.min_corner, g.antenna_min() - padding);
        expect_vec_near(g.detail_view.max_corner, g.antenna_max() + padding);

        for (const auto& wing : g.wings) {
            for (const auto& v : wing.vertices) {
                EXPECT_TRUE(g.detail_view.contains(v));
                for (size_t i = 0; i < 3; ++i) {
                    EXPECT_GT(v[i], g.detail_view.min_corner[i]);
                    EXPECT_LT(v[i], g.detail_view.max_corner[i]);
                }
            }
        }
    }
}

TEST(BowtieBuilderTest, WingsAreFlatAndNonDegenerate) {
    for (const auto& c : property_cases()) {
        BowtieGeometry g = build_bowtie(c.domain, c.spacing, c.bowtie, Placement::centered());
        for (const auto& wing : g.wings) {
            EXPECT_DOUBLE_EQ(wing.vertices[0].z, wing.vertices[1].z);
            EXPECT_DOUBLE_EQ(wing.vertices[0].z, wing.vertices[2].z);
            EXPECT_NEAR(wing.doubled_area(), c.bowtie.length * c.bowtie.height, 1e-12);
        }
    }
}

TEST(BowtieBuilderTest, RepeatedBuildsAreIdentical) {
    BowtieGeometry a = build_bowtie(default_domain(), default_spacing(),
                                    default_bowtie(), Placement::centered());
    BowtieGeometry b = build_bowtie(default_domain(), default_spacing(),
                                    default_bowtie(), Placement::centered());
    for (size_t w = 0; w < 2; ++w) {
        for (size_t k = 0; k < 3; ++k) {
            EXPECT_EQ(a.wings[w].vertices[k], b.wings[w].vertices[k]);
        }
    }
}

// ============================================
// Feed offset variants
// ============================================

TEST(BowtieBuilderTest, FirstWingOnlyOffset) {
    Placement p = Placement::centered();
    p.feed_offset.wings = OffsetWings::First;
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(), default_bowtie(), p);

    expect_vec_near(g.wings[0].vertices[2], {0.151, 0.1, 0.05});
    expect_vec_near(g.wings[1].vertices[0], {0.1, 0.05, 0.05});
    expect_vec_near(g.wings[1].vertices[2], {0.05, 0.1, 0.05});
}

TEST(BowtieBuilderTest, SecondWingOnlyOffset) {
    Placement p = Placement::centered();
    p.feed_offset.wings = OffsetWings::Second;
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(), default_bowtie(), p);

    expect_vec_near(g.wings[0].vertices[2], {0.15, 0.1, 0.05});
    expect_vec_near(g.wings[1].vertices[2], {0.049, 0.1, 0.05});
}

TEST(BowtieBuilderTest, TransverseOffsetShiftsTowardPositiveY) {
    Placement p = Placement::centered();
    p.feed_offset = FeedOffset{Axis::Y, 1.0, OffsetWings::Both};
    BowtieGeometry g = build_bowtie(default_domain(), default_spacing(), default_bowtie(), p);

    expect_vec_near(g.wings[0].vertices[0], {0.1, 0.051, 0.05});
    expect_vec_near(g.wings[0].vertices[2], {0.15, 0.101, 0.05});
    expect_vec_near(g.wings[1].vertices[2], {0.05, 0.101, 0.05});
}

TEST(BowtieBuilderTest, OffsetMagnitudeScalesWithCells) {
    Placement p = Placement::centered();
    p.feed_offset.cells = 3.0;
    GridSpacing spacing{0.002, 0.001, 0.001};
    BowtieGeometry g = build_bowtie(default_domain(), spacing, default_bowtie(), p);

    EXPECT_NEAR(g.wings[0].vertices[0].x - g.feed_point.x, 0.006, TOLERANCE);
    EXPECT_NEAR(g.feed_point.x - g.wings[1].vertices[0].x, 0.006, TOLERANCE);
}

// ============================================
// Errors
// ============================================

TEST(BowtieBuilderTest, RejectsNonPositiveDimensions) {
    Placement p = Placement::centered();
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.0, 0.1}, p),
                 InvalidGeometryError);
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.05, 0.0}, p),
                 InvalidGeometryError);
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {-0.05, 0.1}, p),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsNonPositiveSpacing) {
    Placement p = Placement::centered();
    EXPECT_THROW(build_bowtie(default_domain(), {0.0, 0.001, 0.001}, default_bowtie(), p),
                 InvalidGeometryError);
    EXPECT_THROW(build_bowtie(default_domain(), {0.001, -0.001, 0.001}, default_bowtie(), p),
                 InvalidGeometryError);
    EXPECT_THROW(build_bowtie(default_domain(), {0.001, 0.001, 0.0}, default_bowtie(), p),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsNonPositiveDomain) {
    EXPECT_THROW(build_bowtie({0.2, 0.0, 0.1}, default_spacing(), default_bowtie(),
                              Placement::centered()),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, UnderflowingHeightIsDegenerate) {
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.05, 1e-20},
                              Placement::centered()),
                 DegenerateGeometryError);
}

TEST(BowtieBuilderTest, RejectsAntennaOutsideDomain) {
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.2, 0.1},
                              Placement::centered()),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsGroundHeightOutsideDomain) {
    Domain domain{0.2, 0.12, 0.12};
    EXPECT_THROW(build_bowtie(domain, default_spacing(), default_bowtie(),
                              Placement::ground_offset(0.0)),
                 InvalidGeometryError);
    EXPECT_THROW(build_bowtie(domain, default_spacing(), default_bowtie(),
                              Placement::ground_offset(0.12)),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsProbeOutsideDomain) {
    Domain domain{0.2, 0.12, 0.03};
    EXPECT_THROW(build_bowtie(domain, default_spacing(), default_bowtie(),
                              Placement::ground_offset(0.02)),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsVertexInsideFeedCell) {
    // Unshifted wing with a base narrower than one cell around the feed
    Placement p = Placement::centered();
    p.feed_offset = FeedOffset{Axis::Y, 1.0, OffsetWings::First};
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.05, 0.0015}, p),
                 InvalidGeometryError);
}

TEST(BowtieBuilderTest, RejectsUnsupportedOffset) {
    Placement p = Placement::centered();
    p.feed_offset.axis = Axis::Z;
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), default_bowtie(), p),
                 UnknownVariantError);

    p = Placement::centered();
    p.feed_offset.cells = 0.0;
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), default_bowtie(), p),
                 UnknownVariantError);
}

TEST(BowtieBuilderTest, ErrorsShareBaseType) {
    EXPECT_THROW(build_bowtie(default_domain(), default_spacing(), {0.0, 0.0},
                              Placement::centered()),
                 BowtieError);
}
