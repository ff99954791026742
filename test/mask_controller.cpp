#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE mask controller

#include "QtTestSupport.h"
#include "../src/kspace/MaskController.h"
#include <boost/test/unit_test.hpp>
#include <cmath>
#include <vector>

BOOST_TEST_GLOBAL_FIXTURE( QtAppFixture );

namespace {

MaskController::Config testConfig()
{
    MaskController::Config cfg;
    cfg.debounceMs = 60;
    cfg.initialRadiusPx = 35;
    cfg.minRadiusPx = 5;
    cfg.handleHitRadiusPx = 10;
    return cfg;
}

struct Commit
{
    QPoint center;
    int radius;
};

//256x256 spectrum drawn at 512x512, selection shown
struct ActiveController
{
    ActiveController()
        : controller(testConfig())
    {
        QObject::connect(&controller, &MaskController::maskSettled,
            [this](const QPoint& c, int r) { commits.push_back(Commit{c, r}); });
        QObject::connect(&controller, &MaskController::radiusPreview,
            [this](int r) { previews.push_back(r); });
        controller.setNaturalSize(QSize(256, 256));
        controller.setDisplaySize(QSizeF(512, 512));
        controller.setActive(true);
    }

    MaskController controller;
    std::vector<Commit> commits;
    std::vector<int> previews;
};

}

BOOST_AUTO_TEST_SUITE( mask_controller )

BOOST_AUTO_TEST_SUITE( activation )

    BOOST_FIXTURE_TEST_CASE( showing_commits_centered_mask_once, ActiveController )
    {
        BOOST_REQUIRE_EQUAL(commits.size(), 1u);
        BOOST_CHECK_EQUAL(commits[0].center.x(), 128);
        BOOST_CHECK_EQUAL(commits[0].center.y(), 128);
        BOOST_CHECK_EQUAL(commits[0].radius, 18); //35 display px at half scale
        BOOST_REQUIRE(controller.committedMask().has_value());
        BOOST_CHECK(*controller.committedMask() == (CircleMask{128, 128, 18}));
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::Idle);
        BOOST_CHECK(!controller.hasPendingCommit());
    }

    BOOST_AUTO_TEST_CASE( odd_sizes_center_on_floor )
    {
        MaskController controller(testConfig());
        controller.setNaturalSize(QSize(101, 57));
        controller.setDisplaySize(QSizeF(202, 114));
        controller.setActive(true);
        BOOST_REQUIRE(controller.committedMask().has_value());
        BOOST_CHECK_EQUAL(controller.committedMask()->cx, 50);
        BOOST_CHECK_EQUAL(controller.committedMask()->cy, 28);
    }

    BOOST_AUTO_TEST_CASE( activation_waits_for_geometry )
    {
        MaskController controller(testConfig());
        int settled = 0;
        QObject::connect(&controller, &MaskController::maskSettled, [&](const QPoint&, int) { ++settled; });

        controller.setActive(true);
        BOOST_CHECK_EQUAL(settled, 0);
        controller.setNaturalSize(QSize(64, 64));
        BOOST_CHECK_EQUAL(settled, 0);
        controller.setDisplaySize(QSizeF(128, 128));
        BOOST_CHECK_EQUAL(settled, 1);
    }

    BOOST_FIXTURE_TEST_CASE( hiding_clears_state, ActiveController )
    {
        controller.setActive(false);
        BOOST_CHECK(!controller.committedMask().has_value());
        BOOST_CHECK(!controller.hasMask());
        BOOST_CHECK(!controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(300, 300));
        controller.pointerUp();
        pumpEvents(150);
        BOOST_CHECK_EQUAL(commits.size(), 1u);
    }

BOOST_AUTO_TEST_SUITE_END() //activation

BOOST_AUTO_TEST_SUITE( gestures )

    BOOST_FIXTURE_TEST_CASE( debounce_coalesces_moves, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::DraggingCenter);
        BOOST_CHECK_EQUAL(commits.size(), 1u);

        for(int i=0; i<10; ++i)
            controller.pointerMove(QPointF(200 + 4*i, 220 + 6*i));
        BOOST_CHECK_EQUAL(commits.size(), 1u);
        BOOST_CHECK(controller.hasPendingCommit());

        pumpEvents(250);
        BOOST_REQUIRE_EQUAL(commits.size(), 2u);
        BOOST_CHECK_EQUAL(commits.back().center.x(), 118); //236 / 2
        BOOST_CHECK_EQUAL(commits.back().center.y(), 137); //274 / 2
        BOOST_CHECK_EQUAL(commits.back().radius, 18);
        //still dragging: the timer commits without ending the gesture
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::DraggingCenter);
    }

    BOOST_FIXTURE_TEST_CASE( pointer_up_commits_immediately, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(300, 240));
        controller.pointerMove(QPointF(310, 250));
        controller.pointerUp();

        BOOST_REQUIRE_EQUAL(commits.size(), 2u);
        BOOST_CHECK_EQUAL(commits.back().center.x(), 155);
        BOOST_CHECK_EQUAL(commits.back().center.y(), 125);
        BOOST_CHECK(!controller.hasPendingCommit());
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::Idle);

        //the displayed and committed masks agree after the gesture
        BOOST_CHECK(*controller.committedMask() == controller.displayedMask());

        pumpEvents(150);
        BOOST_CHECK_EQUAL(commits.size(), 2u);
    }

    BOOST_FIXTURE_TEST_CASE( pointer_cancel_commits, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(280, 280));
        controller.pointerCancel();
        BOOST_REQUIRE_EQUAL(commits.size(), 2u);
        BOOST_CHECK_EQUAL(commits.back().center.x(), 140);
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::Idle);
    }

    BOOST_FIXTURE_TEST_CASE( press_outside_circle_is_ignored, ActiveController )
    {
        BOOST_CHECK(!controller.pointerDown(QPointF(20, 20)));
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::Idle);
        controller.pointerMove(QPointF(30, 30));
        controller.pointerUp();
        pumpEvents(150);
        BOOST_CHECK_EQUAL(commits.size(), 1u);
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 256.0);
    }

    BOOST_FIXTURE_TEST_CASE( handle_starts_resize, ActiveController )
    {
        const QPointF handle = controller.handlePosition();
        BOOST_CHECK_CLOSE(handle.x(), 256 + 35/std::sqrt(2.0), 1e-6);
        BOOST_CHECK_CLOSE(handle.y(), 256 + 35/std::sqrt(2.0), 1e-6);

        BOOST_CHECK(controller.hitsHandle(handle + QPointF(5, 5)));
        BOOST_CHECK(!controller.hitsHandle(handle + QPointF(8, 8)));

        //the handle sits on the rim and wins over the interior
        BOOST_REQUIRE(controller.pointerDown(handle + QPointF(-3, -3)));
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::ResizingRadius);

        controller.pointerMove(QPointF(256 + 60, 256 + 80));
        BOOST_CHECK_CLOSE(controller.radiusPx(), 100.0, 1e-9);
        BOOST_REQUIRE_EQUAL(previews.size(), 1u);
        BOOST_CHECK_EQUAL(previews.back(), 100);
        //resizing never moves the center
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 256.0);

        controller.pointerUp();
        BOOST_REQUIRE_EQUAL(commits.size(), 2u);
        BOOST_CHECK_EQUAL(commits.back().radius, 50);
        BOOST_CHECK_EQUAL(commits.back().center.x(), 128);
    }

BOOST_AUTO_TEST_SUITE_END() //gestures

BOOST_AUTO_TEST_SUITE( clamping )

    BOOST_FIXTURE_TEST_CASE( center_stays_inside_display, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(-50, 1000));
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 35.0);
        BOOST_CHECK_EQUAL(controller.displayCenter().y(), 512.0 - 35.0);
        controller.pointerMove(QPointF(900, -4));
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 512.0 - 35.0);
        BOOST_CHECK_EQUAL(controller.displayCenter().y(), 35.0);
    }

    BOOST_FIXTURE_TEST_CASE( radius_bounded_by_edges_and_minimum, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(controller.handlePosition()));

        controller.pointerMove(QPointF(2000, 2000));
        BOOST_CHECK_EQUAL(controller.radiusPx(), 256.0);

        controller.pointerMove(QPointF(257, 258));
        BOOST_CHECK_EQUAL(controller.radiusPx(), 5.0);
        BOOST_CHECK_EQUAL(previews.back(), 5);
        controller.pointerUp();
        BOOST_CHECK_EQUAL(commits.back().radius, 3); //round(2.5)
    }

    BOOST_FIXTURE_TEST_CASE( maximum_radius_follows_center, ActiveController )
    {
        //move the circle close to the left edge, then try to grow it
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(60, 256));
        controller.pointerUp();

        BOOST_REQUIRE(controller.pointerDown(controller.handlePosition()));
        controller.pointerMove(QPointF(400, 400));
        BOOST_CHECK_EQUAL(controller.radiusPx(), 60.0);
        controller.pointerUp();
    }

BOOST_AUTO_TEST_SUITE_END() //clamping

BOOST_AUTO_TEST_SUITE( coordinates )

    BOOST_AUTO_TEST_CASE( independent_axis_scales )
    {
        MaskController controller(testConfig());
        controller.setNaturalSize(QSize(200, 100));
        controller.setDisplaySize(QSizeF(400, 400));

        BOOST_CHECK_CLOSE(controller.scaleX(), 0.5, 1e-9);
        BOOST_CHECK_CLOSE(controller.scaleY(), 0.25, 1e-9);
        BOOST_CHECK(controller.toNatural(QPointF(100, 100)) == QPoint(50, 25));
        BOOST_CHECK(controller.toNatural(QPointF(101, 102)) == QPoint(51, 26)); //50.5, 25.5 round away from zero
        BOOST_CHECK(controller.toDisplay(QPointF(50, 25)) == QPointF(100, 100));

        controller.setActive(true);
        BOOST_REQUIRE(controller.committedMask().has_value());
        //radius converts with the horizontal scale only
        BOOST_CHECK(*controller.committedMask() == (CircleMask{100, 50, 18}));
    }

    BOOST_FIXTURE_TEST_CASE( display_resize_keeps_natural_mask, ActiveController )
    {
        const CircleMask before = controller.displayedMask();
        controller.setDisplaySize(QSizeF(256, 256));
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 128.0);
        BOOST_CHECK_CLOSE(controller.radiusPx(), 17.5, 1e-9);
        BOOST_CHECK(controller.displayedMask() == before);
        BOOST_CHECK_EQUAL(commits.size(), 1u);
    }

BOOST_AUTO_TEST_SUITE_END() //coordinates

BOOST_AUTO_TEST_SUITE( ignored_input )

    BOOST_FIXTURE_TEST_CASE( disabled_ignores_pointer, ActiveController )
    {
        controller.setEnabled(false);
        BOOST_CHECK(!controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(300, 300));
        controller.pointerUp();
        pumpEvents(150);
        BOOST_CHECK_EQUAL(commits.size(), 1u);
        BOOST_CHECK_EQUAL(controller.displayCenter().x(), 256.0);

        controller.setEnabled(true);
        BOOST_CHECK(controller.pointerDown(QPointF(256, 256)));
    }

    BOOST_FIXTURE_TEST_CASE( disabling_mid_gesture_ends_it, ActiveController )
    {
        BOOST_REQUIRE(controller.pointerDown(QPointF(256, 256)));
        controller.pointerMove(QPointF(270, 256));
        controller.setEnabled(false);
        BOOST_CHECK(controller.gesture() == MaskController::Gesture::Idle);
        BOOST_REQUIRE_EQUAL(commits.size(), 2u);
        BOOST_CHECK_EQUAL(commits.back().center.x(), 135);
        BOOST_CHECK(!controller.hasPendingCommit());
    }

    BOOST_AUTO_TEST_CASE( zero_display_size_ignores_pointer )
    {
        MaskController controller(testConfig());
        controller.setNaturalSize(QSize(64, 64));
        controller.setActive(true);
        BOOST_CHECK(!controller.hasMask());
        BOOST_CHECK(!controller.pointerDown(QPointF(0, 0)));
        BOOST_CHECK(!controller.committedMask().has_value());
    }

BOOST_AUTO_TEST_SUITE_END() //ignored_input

BOOST_AUTO_TEST_SUITE_END() //mask_controller
