/*
FILE: tests/test_frame_shift.cpp
PURPOSE: Heliocentric/barycentric shift at J2000 and its epoch and frame guards.
*/
#include <cassert>
#include <cmath>
#include <cstdio>

#include "coordinate/frame_shift.hpp"

using namespace solcat;

static StateVector helio_state(double epoch) {
    StateVector s(epoch, Vec3(1000.0, -2000.0, 30.0), Vec3(0.01, 0.02, -0.001));
    s.frame = CoordinateFrame::HELIOCENTRIC_ECLIPTIC;
    return s;
}

static void test_offset_applied() {
    StateVector bary = FrameShift::to_barycentric(helio_state(J2000_JD));

    assert(bary.frame == CoordinateFrame::BARYCENTRIC_ECLIPTIC);
    assert(bary.epoch == J2000_JD);
    assert(bary.position.x == 1000.0 + -1.067598502264559E+03);
    assert(bary.position.y == -2000.0 + -4.182343932742174E+02);
    assert(bary.position.z == 30.0 + 3.083761810502339E+01);
    assert(bary.velocity.x == 0.01 + 9.312570119052345E-06);
    assert(bary.velocity.y == 0.02 + -1.282474958274199E-05);
    assert(bary.velocity.z == -0.001 + -1.633335103087856E-07);
}

static void test_per_day_velocity_offset() {
    StateVector s = helio_state(J2000_JD);
    s.velocity_unit = VelocityUnit::PER_DAY;

    StateVector bary = FrameShift::to_barycentric(s);
    double expected = 0.01 + 9.312570119052345E-06 * SECONDS_PER_DAY;
    assert(std::fabs(bary.velocity.x - expected) < 1e-15);
    assert(bary.velocity_unit == VelocityUnit::PER_DAY);
}

static void test_other_epoch_rejected() {
    bool threw = false;
    try {
        FrameShift::to_barycentric(helio_state(J2000_JD + 1.0));
    } catch (const FrameShiftError&) {
        threw = true;
    }
    assert(threw);
}

static void test_wrong_frame_rejected() {
    StateVector already = FrameShift::to_barycentric(helio_state(J2000_JD));

    bool threw = false;
    try {
        FrameShift::to_barycentric(already);
    } catch (const FrameShiftError&) {
        threw = true;
    }
    assert(threw);
}

int main(void) {
    test_offset_applied();
    test_per_day_velocity_offset();
    test_other_epoch_rejected();
    test_wrong_frame_rejected();

    std::printf("test_frame_shift: OK\n");
    return 0;
}
