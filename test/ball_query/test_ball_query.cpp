// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

/**
 * Ball query refinement tests
 * radius filtering around the anchor and the radius-query network variant
 */

#include "ball_query.h"
#include "psn.h"
#include "sampling.h"
#include "test_utils.h"

using namespace psn_test;

namespace {

// 每个邻居到锚点的平方距离 [B, s, n]
at::Tensor anchor_distance2(const at::Tensor &coordinate,
                            const at::Tensor &sampled_idx,
                            const at::Tensor &grouped_idx) {
  at::Tensor anchor = psn::gather_points(coordinate, sampled_idx).unsqueeze(2);
  return (psn::gather_points(coordinate, grouped_idx) - anchor).pow(2).sum(3);
}

}  // namespace

int main() {
  torch::manual_seed(0);
  TestRunner runner("ball_query");

  runner.run("out-of-radius neighbors collapse to the anchor", [] {
    at::Tensor coordinate = torch::tensor({{{0.0f, 0.0f, 0.0f},
                                            {0.5f, 0.0f, 0.0f},
                                            {3.0f, 0.0f, 0.0f},
                                            {0.0f, 0.9f, 0.0f}}});
    at::Tensor sampled = torch::tensor({{0}}, torch::kLong);
    at::Tensor grouped = torch::tensor({{{0, 1, 2, 3}}}, torch::kLong);

    at::Tensor refined = psn::ball_query_refine(coordinate, sampled, grouped, 1.0);
    expect_equal(refined, torch::tensor({{{0, 1, 0, 3}}}, torch::kLong),
                 "refined indices");
    expect_equal(grouped, torch::tensor({{{0, 1, 2, 3}}}, torch::kLong),
                 "input left untouched");
  });

  runner.run("refinement is idempotent", [] {
    at::Tensor coordinate = torch::rand({3, 200, 3}) * 4;
    at::Tensor grouped = torch::randint(0, 200, {3, 10, 16}, torch::kLong);
    at::Tensor sampled = grouped.select(2, 0).contiguous();

    at::Tensor once = psn::ball_query_refine(coordinate, sampled, grouped, 1.5);
    at::Tensor twice = psn::ball_query_refine(coordinate, sampled, once, 1.5);
    expect_equal(twice, once, "second refinement");
    expect((anchor_distance2(coordinate, sampled, once) <= 1.5 * 1.5)
               .all()
               .item<bool>(),
           "neighbor outside radius");
  });

  runner.run("rejects a non-positive radius", [] {
    at::Tensor coordinate = torch::rand({1, 8, 3});
    at::Tensor sampled = torch::zeros({1, 2}, torch::kLong);
    at::Tensor grouped = torch::zeros({1, 2, 3}, torch::kLong);
    expect_error(
        [&] { psn::ball_query_refine(coordinate, sampled, grouped, 0.0); },
        "radius must be positive");
  });

  runner.run("radius variant returns anchors and refined neighborhoods", [] {
    psn::PointStructuringNet net(psn::PSNOptions::radius_query(
        /*num_to_sample=*/32, /*radius=*/0.5, /*max_local_num=*/16));
    at::Tensor coordinate = sphere_points(2, 256);

    psn::SamplingResult r = net(coordinate);
    expect_shape(r.sampled_indices, {2, 32}, "sampled indices");
    expect_shape(r.grouped_indices, {2, 32, 16}, "grouped indices");
    expect_shape(r.scores, {2, 32, 256}, "scores");
    expect_close(r.scores.sum(1), torch::ones({2, 256}),
                 "softmax over sample slots", 1e-5);
    expect_equal(r.grouped_indices.select(2, 0), r.sampled_indices,
                 "rank 0 is the anchor");
    expect((anchor_distance2(coordinate, r.sampled_indices, r.grouped_indices) <=
            0.25 + 1e-6)
               .all()
               .item<bool>(),
           "neighbor outside radius");
    expect(!r.sampled_feature.defined(), "radius variant has no features");
  });

  return runner.summary();
}
