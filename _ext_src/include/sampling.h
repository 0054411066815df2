// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

namespace psn {

/*
 * @brief 点云特征采样(Gather Points)
 *
 * 沿点维度按批次收集points中idx指定的点。idx除批次维外可以有任意多个维度,
 * 输出形状为idx的形状再追加通道维C。
 * 例如idx为[B, s]时输出[B, s, C], idx为[B, s, n]时输出[B, s, n, C]。
 *
 * @param points (Tensor) 输入点云坐标或特征, 形状为[B, N, C]
 * @param idx    (Tensor) 采样索引, int64, 形状为[B, ...]
 * @return       (Tensor) 采样后的数据, 形状为[B, ..., C]
 */
at::Tensor gather_points(at::Tensor points, at::Tensor idx);

/*
 * @brief 点云特征采样的反向传播(Gather Points Grad)
 *
 * 将上游梯度grad_out根据idx累加回原始输入points的位置。
 * 同一个点被多次采样时梯度相加。
 *
 * @param grad_out (Tensor) 上游梯度, 形状为[B, ..., C]
 * @param idx      (Tensor) 采样索引, 形状为[B, ...]
 * @param n        (int)    原始点的数量N
 * @return         (Tensor) points的梯度, 形状为[B, N, C]
 */
at::Tensor gather_points_grad(at::Tensor grad_out, at::Tensor idx,
                              const int64_t n);

/*
 * @brief 可反向传播的点云索引(Index Points)
 *
 * 以gather_points为前向、gather_points_grad为反向的autograd函数。
 */
at::Tensor index_points(at::Tensor points, at::Tensor idx);

/*
 * @brief Top-k邻域选择
 *
 * 对得分矩阵Q的每一行(每个采样槽位)取得分最大的k个点的索引, 按得分降序排列。
 *
 * @param scores (Tensor) 得分矩阵Q, 形状为[B, s, m]
 * @param k      (int)    邻域点数, 必须小于m
 * @return       (Tensor) 分组索引, int64, 形状为[B, s, k]
 */
at::Tensor select_topk(at::Tensor scores, const int64_t k);

// 采样标准Gumbel噪声, -log(-log(U + eps) + eps)
at::Tensor sample_gumbel(at::IntArrayRef shape, const at::TensorOptions &options,
                         double eps = 1e-20);

// 沿最后一维取最大值位置的one-hot张量
at::Tensor onehot_from_logits(at::Tensor logits);

/*
 * @brief 松弛类别采样(Gumbel-Softmax)
 *
 * 沿点维度(最后一维)对每个采样槽位做一次Gumbel扰动的softmax采样。
 * hard为true时使用直通估计: 前向值为one-hot, 反向梯度等同于软采样。
 *
 * @param scores      (Tensor) 得分矩阵Q, 形状为[B, s, m]
 * @param temperature (double) 温度, 必须大于0
 * @param hard        (bool)   是否硬化为one-hot
 * @return            (Tensor) 选择权重矩阵, 形状为[B, s, m]
 */
at::Tensor relaxed_select(at::Tensor scores, const double temperature,
                          const bool hard = true);

}  // namespace psn
