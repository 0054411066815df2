// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "ball_query.h"
#include "sampling.h"
#include "utils.h"

namespace psn {

/*
 * @brief 球查询邻域修正主函数
 *
 * 计算每个邻居到锚点的平方距离, 大于radius^2的位置用锚点索引替换。
 * 结果为新张量, grouped_idx保持不变。
 */
at::Tensor ball_query_refine(at::Tensor coordinate, at::Tensor sampled_idx,
                             at::Tensor grouped_idx, const double radius) {
  // 检查输入维度与类型
  CHECK_DIM(coordinate, 3);
  CHECK_DIM(sampled_idx, 2);
  CHECK_DIM(grouped_idx, 3);
  CHECK_IS_FLOATING(coordinate);
  CHECK_IS_LONG(sampled_idx);
  CHECK_IS_LONG(grouped_idx);
  TORCH_CHECK(radius > 0, "radius must be positive, got ", radius);
  TORCH_CHECK(sampled_idx.size(0) == grouped_idx.size(0) &&
                  sampled_idx.size(1) == grouped_idx.size(1),
              "sampled_idx [B, s] must match grouped_idx [B, s, n]");

  // 锚点坐标 [B, s, 1, 3], 邻居坐标 [B, s, n, 3]
  at::Tensor sampled_coordinate =
      gather_points(coordinate, sampled_idx).unsqueeze(2);
  at::Tensor grouped_coordinate = gather_points(coordinate, grouped_idx);

  at::Tensor dist2 = (grouped_coordinate - sampled_coordinate).pow(2).sum(3);
  at::Tensor mask = dist2 > radius * radius;

  // 超出半径的邻居替换为锚点索引
  at::Tensor anchor = sampled_idx.unsqueeze(2).expand_as(grouped_idx);
  return torch::where(mask, anchor, grouped_idx);
}

}  // namespace psn
