// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "group_points.h"
#include "sampling.h"
#include "utils.h"

namespace psn {

at::Tensor group_points(at::Tensor points, at::Tensor idx) {
  CHECK_DIM(points, 3);
  CHECK_DIM(idx, 3);
  CHECK_IS_LONG(idx);

  // [B, s, n, C]
  return index_points(points, idx);
}

at::Tensor replace_leading_neighbor(at::Tensor grouped, at::Tensor leading) {
  CHECK_DIM(grouped, 4);
  CHECK_DIM(leading, 3);
  TORCH_CHECK(grouped.size(0) == leading.size(0) &&
                  grouped.size(1) == leading.size(1) &&
                  grouped.size(3) == leading.size(2),
              "leading must have shape [B, s, C] matching grouped [B, s, n, C]");

  return torch::cat({leading.unsqueeze(2), grouped.slice(2, 1)}, 2);
}

std::vector<at::Tensor> slice_neighborhoods(at::Tensor grouped,
                                            const std::vector<int64_t> &scales) {
  TORCH_CHECK(grouped.dim() >= 3,
              "grouped must have at least 3 dimensions [B, s, k]");
  TORCH_CHECK(!scales.empty(), "scales must not be empty");

  const int64_t k = grouped.size(2);
  std::vector<at::Tensor> output;
  output.reserve(scales.size());

  int64_t prev = 0;
  for (int64_t n : scales) {
    TORCH_CHECK(n > prev, "scales must be positive and sorted ascending");
    TORCH_CHECK(n <= k, "scale ", n, " exceeds neighborhood size ", k);
    output.push_back(grouped.slice(2, 0, n));
    prev = n;
  }
  return output;
}

double grouping_coverage(at::Tensor grouped_idx, const int64_t m) {
  CHECK_IS_LONG(grouped_idx);
  TORCH_CHECK(m > 0, "m must be positive");

  TORCH_CHECK(grouped_idx.dim() >= 1, "grouped_idx must have a batch dimension");

  // 空批次无法reshape出-1维
  const int64_t batch = grouped_idx.size(0);
  if (batch == 0) {
    return 0.0;
  }
  at::Tensor flat = grouped_idx.detach().reshape({batch, -1});

  double total = 0.0;
  for (int64_t b = 0; b < batch; ++b) {
    at::Tensor unique = std::get<0>(torch::unique_dim(flat[b], 0));
    total += static_cast<double>(unique.size(0)) / m;
  }
  return total / batch;
}

}  // namespace psn
