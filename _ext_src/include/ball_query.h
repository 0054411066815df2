// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

namespace psn {

/*
 * @brief 球查询邻域修正(Ball Query Refine)
 *
 * 以每个采样槽位的第0个邻居(锚点)为球心, 将与锚点距离超过radius的邻居索引
 * 替换为锚点自身的索引, 即超出半径的邻居以锚点重复填充。
 * 对已修正的结果再次调用不会产生变化。
 *
 * 该函数是启发式条件C(x)的一个例子, 可替换为任意逐点的包含判据。
 *
 * @param coordinate     (Tensor) 原始点云坐标, 形状为[B, m, 3]
 * @param sampled_idx    (Tensor) 锚点索引, 形状为[B, s]
 * @param grouped_idx    (Tensor) 分组索引, 形状为[B, s, n]
 * @param radius         (float)  球查询半径
 * @return               (Tensor) 修正后的分组索引, 形状为[B, s, n]
 */
at::Tensor ball_query_refine(at::Tensor coordinate, at::Tensor sampled_idx,
                             at::Tensor grouped_idx, const double radius);

}  // namespace psn
