// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

#include <vector>

namespace psn {

/*
 * @brief 点云分组操作(Group Points)
 *
 * 根据分组索引idx, 为每个采样槽位收集其邻域内的点坐标或特征。
 * 常用于点云网络的局部特征聚合阶段。
 *
 * @param points (Tensor) 输入点云坐标或特征, 形状为[B, N, C]
 * @param idx    (Tensor) 分组索引, 形状为[B, s, n], s为采样槽位数, n为邻域点数
 * @return       (Tensor) 分组后的数据, 形状为[B, s, n, C]
 */
at::Tensor group_points(at::Tensor points, at::Tensor idx);

/*
 * @brief 替换邻域的第0个点
 *
 * 返回一个新的分组张量, 其邻域第0位为leading, 其余位置与grouped相同。
 * 不修改grouped本身。
 *
 * @param grouped (Tensor) 分组数据, 形状为[B, s, n, C]
 * @param leading (Tensor) 新的第0位数据, 形状为[B, s, C]
 * @return        (Tensor) 形状为[B, s, n, C]
 */
at::Tensor replace_leading_neighbor(at::Tensor grouped, at::Tensor leading);

/*
 * @brief 多尺度邻域切片(Multi-Scale Grouping)
 *
 * 对共享的top-k分组张量, 按scales中的每个n取前n个邻居。
 * scales必须升序且每个值不超过邻域维度大小。
 *
 * @param grouped (Tensor) 分组索引或分组数据, 形状为[B, s, k, ...]
 * @param scales  (list)   各尺度的邻域点数
 * @return        (list)   每个尺度一个张量, 形状为[B, s, n_i, ...]
 */
std::vector<at::Tensor> slice_neighborhoods(at::Tensor grouped,
                                            const std::vector<int64_t> &scales);

/*
 * @brief 分组覆盖率
 *
 * 每个批次中被任一邻域引用的不同点数除以m, 再对批次取平均。
 *
 * @param grouped_idx (Tensor) 分组索引, 形状为[B, s, n]
 * @param m           (int)    输入点数
 * @return            (double) 覆盖率, 范围(0, 1]
 */
double grouping_coverage(at::Tensor grouped_idx, const int64_t m);

}  // namespace psn
