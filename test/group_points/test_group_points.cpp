// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

/**
 * Grouping tests
 * group_points, slot-0 replacement, multi-scale slicing and coverage
 */

#include "group_points.h"
#include "test_utils.h"

using namespace psn_test;

int main() {
  torch::manual_seed(0);
  TestRunner runner("group_points");

  runner.run("group_points returns [B, s, n, C]", [] {
    at::Tensor points = torch::randn({2, 64, 3});
    at::Tensor idx = torch::randint(0, 64, {2, 8, 4}, torch::kLong);
    at::Tensor grouped = psn::group_points(points, idx);
    expect_shape(grouped, {2, 8, 4, 3}, "grouped");
    expect_equal(grouped[1][5][3], points[1][idx[1][5][3].item<int64_t>()],
                 "grouped row");
  });

  runner.run("group_points rejects [B, s] indices", [] {
    at::Tensor points = torch::randn({2, 64, 3});
    at::Tensor idx = torch::zeros({2, 8}, torch::kLong);
    expect_error([&] { psn::group_points(points, idx); }, "3-D tensor");
  });

  runner.run("replace_leading_neighbor builds a new tensor", [] {
    at::Tensor grouped = torch::randn({2, 5, 4, 6});
    at::Tensor before = grouped.clone();
    at::Tensor leading = torch::randn({2, 5, 6});

    at::Tensor replaced = psn::replace_leading_neighbor(grouped, leading);
    expect_shape(replaced, {2, 5, 4, 6}, "replaced");
    expect_equal(replaced.select(2, 0), leading, "slot 0");
    expect_equal(replaced.slice(2, 1), grouped.slice(2, 1), "slots 1..n");
    expect_equal(grouped, before, "input left untouched");
  });

  runner.run("slice_neighborhoods takes the leading n neighbors per scale", [] {
    at::Tensor grouped = torch::randint(0, 100, {2, 3, 16}, torch::kLong);
    std::vector<at::Tensor> scales = psn::slice_neighborhoods(grouped, {4, 8, 16});
    expect(scales.size() == 3, "expected 3 scales");
    expect_equal(scales[0], grouped.slice(2, 0, 4), "scale 4");
    expect_equal(scales[1], grouped.slice(2, 0, 8), "scale 8");
    expect_equal(scales[2], grouped, "scale 16");
  });

  runner.run("slice_neighborhoods validates the scale list", [] {
    at::Tensor grouped = torch::zeros({1, 2, 8}, torch::kLong);
    expect_error([&] { psn::slice_neighborhoods(grouped, {8, 4}); },
                 "sorted ascending");
    expect_error([&] { psn::slice_neighborhoods(grouped, {4, 9}); },
                 "exceeds neighborhood size");
    expect_error([&] { psn::slice_neighborhoods(grouped, {}); }, "empty");
  });

  runner.run("grouping_coverage counts distinct indices per batch", [] {
    // batch 0 引用了全部8个点, batch 1只引用了2个
    at::Tensor idx = torch::tensor(
        {{{0, 1, 2, 3}, {4, 5, 6, 7}}, {{0, 0, 0, 0}, {1, 1, 1, 1}}},
        torch::kLong);
    const double coverage = psn::grouping_coverage(idx, 8);
    expect(std::abs(coverage - (1.0 + 0.25) / 2) < 1e-9,
           "coverage " + std::to_string(coverage));
  });

  runner.run("grouping_coverage of an empty batch is zero", [] {
    at::Tensor idx = torch::zeros({0, 2, 3}, torch::kLong);
    expect(psn::grouping_coverage(idx, 8) == 0.0, "empty batch coverage");
  });

  return runner.summary();
}
