// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

/**
 * Multi-scale grouping variant tests
 */

#include "group_points.h"
#include "psn.h"
#include "sampling.h"
#include "test_utils.h"

using namespace psn_test;

int main() {
  torch::manual_seed(0);
  TestRunner runner("multi_scale");

  runner.run("scales [32, 64] slice one shared top-k neighborhood", [] {
    psn::PointStructuringNet net(psn::PSNOptions::multi_scale(16, {32, 64}));
    at::Tensor coordinate = sphere_points(2, 1024);
    at::Tensor feature = torch::randn({2, 1024, 8});

    psn::SamplingResult r = net(coordinate, feature);
    expect_shape(r.grouped_indices, {2, 16, 64}, "shared grouped indices");
    expect(r.grouped_points_msg.size() == 2, "two point scales");
    expect(r.grouped_feature_msg.size() == 2, "two feature scales");

    at::Tensor full = psn::group_points(coordinate, r.grouped_indices);
    expect_shape(r.grouped_points_msg[0], {2, 16, 32, 3}, "scale 32");
    expect_shape(r.grouped_points_msg[1], {2, 16, 64, 3}, "scale 64");
    expect_equal(r.grouped_points_msg[0], full.slice(2, 0, 32), "scale 32 points");
    expect_equal(r.grouped_points_msg[1], full, "scale 64 points");
    expect_equal(r.grouped_feature_msg[0],
                 psn::group_points(feature, r.grouped_indices.slice(2, 0, 32)),
                 "scale 32 features");
  });

  runner.run("scores are a softmax over sample slots", [] {
    psn::PointStructuringNet net(psn::PSNOptions::multi_scale(16, {8, 16}));
    psn::SamplingResult r = net(sphere_points(2, 128));
    expect_close(r.scores.sum(1), torch::ones({2, 128}), "slot sums", 1e-5);
  });

  runner.run("point from smallest scale, feature from largest scale", [] {
    psn::PointStructuringNet net(psn::PSNOptions::multi_scale(16, {8, 16}));
    at::Tensor feature = torch::randn({2, 128, 4});
    psn::SamplingResult r = net(sphere_points(2, 128), feature);
    expect_equal(r.sampled_points, r.grouped_points_msg.front().select(2, 0),
                 "sampled points");
    expect_equal(r.sampled_feature, r.grouped_feature_msg.back().select(2, 0),
                 "sampled feature");
  });

  runner.run("training replaces slot 0 at every scale", [] {
    psn::PointStructuringNet net(psn::PSNOptions::multi_scale(16, {4, 8, 16}));
    at::Tensor coordinate = sphere_points(2, 128);
    at::Tensor feature = torch::randn({2, 128, 4});

    psn::SamplingResult r = net(coordinate, feature, /*train=*/true);
    expect(r.grouped_feature_msg.size() == 3, "three feature scales");
    for (const at::Tensor &grouped : r.grouped_feature_msg) {
      expect_close(grouped.select(2, 0), r.sampled_feature, "slot 0", 0.0);
    }
    expect_close(r.sampled_points,
                 psn::gather_points(coordinate, r.sampled_indices),
                 "sampled points", 1e-5);
  });

  runner.run("without features only point outputs are produced", [] {
    psn::PointStructuringNet net(psn::PSNOptions::multi_scale(8, {4, 8}));
    psn::SamplingResult r = net(sphere_points(1, 64));
    expect(!r.sampled_feature.defined(), "sampled feature present");
    expect(r.grouped_feature_msg.empty(), "grouped features present");
    expect(r.grouped_points_msg.size() == 2, "two point scales");
  });

  runner.run("msg_n must be sorted ascending", [] {
    expect_error(
        [] { psn::PointStructuringNet net(psn::PSNOptions::multi_scale(8, {64, 32})); },
        "sorted ascending");
  });

  return runner.summary();
}
