// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

#include <ostream>
#include <vector>

#include "feature_transform.h"

namespace psn {

/*
 * @brief Point Structuring Net的变体
 *
 * kLearnable:  5通道几何描述子, sigmoid得分, top-k分组, 训练时Gumbel直通采样。
 * kRadius:     3通道坐标输入, 槽位softmax得分, 排序分组后做球查询修正,
 *              只输出采样索引和分组索引。
 * kMultiScale: 3通道坐标输入, 槽位softmax得分, 一次top-k后切片为多个尺度。
 */
enum class Variant { kLearnable, kRadius, kMultiScale };

const char *variant_name(Variant variant);

struct PSNOptions {
  PSNOptions() = default;

  // 学习型变体, 默认值与原始网络一致
  static PSNOptions learnable(int64_t num_to_sample = 512,
                              int64_t max_local_num = 32,
                              std::vector<int64_t> mlp = {32, 128},
                              bool global_feature = false);

  // 球查询启发式变体
  static PSNOptions radius_query(int64_t num_to_sample = 512,
                                 double radius = 1.0,
                                 int64_t max_local_num = 32,
                                 std::vector<int64_t> mlp = {32, 64, 256},
                                 bool global_feature = false);

  // 多尺度分组变体
  static PSNOptions multi_scale(int64_t num_to_sample = 512,
                                std::vector<int64_t> msg_n = {32, 64},
                                std::vector<int64_t> mlp = {32, 64, 256},
                                bool global_feature = false);

  /*
   * @brief 检查配置是否合法
   *
   * 配置错误在构造时直接抛出c10::Error, 调用者应修正配置而不是重试。
   */
  void validate() const;

  // 特征变换的输入通道数
  int64_t in_channels() const;

  // top-k的k值, 多尺度变体为最大尺度
  int64_t group_size() const;

  TORCH_ARG(Variant, variant) = Variant::kLearnable;
  // 采样点数s
  TORCH_ARG(int64_t, num_to_sample) = 512;
  // 邻域点数n
  TORCH_ARG(int64_t, max_local_num) = 32;
  TORCH_ARG(std::vector<int64_t>, mlp) = std::vector<int64_t>({32, 128});
  TORCH_ARG(bool, global_feature) = false;
  // 球查询半径, 仅kRadius使用
  TORCH_ARG(double, radius) = 1.0;
  // 多尺度邻域点数, 升序, 仅kMultiScale使用
  TORCH_ARG(std::vector<int64_t>, msg_n) = std::vector<int64_t>({32, 64});
  // Gumbel-Softmax温度
  TORCH_ARG(double, temperature) = 0.1;
  TORCH_ARG(Layout, layout) = Layout::kChannelLast;
  // 预期输入点数, 大于0时在构造时检查max_local_num, 0表示未知
  TORCH_ARG(int64_t, num_points) = 0;
};

/*
 * @brief 一次前向的输出
 *
 * 未提供特征时, 特征相关的张量为未定义张量(!defined())。
 */
struct SamplingResult {
  at::Tensor sampled_indices;  // [B, s]
  at::Tensor grouped_indices;  // [B, s, n]
  at::Tensor sampled_points;   // [B, s, 3]
  at::Tensor grouped_points;   // [B, s, n, 3]
  at::Tensor sampled_feature;  // [B, s, d]
  at::Tensor grouped_feature;  // [B, s, n, d]
  // 多尺度变体每个尺度一个张量, [B, s, n_i, 3] / [B, s, n_i, d]
  std::vector<at::Tensor> grouped_points_msg;
  std::vector<at::Tensor> grouped_feature_msg;
  // 推理时为得分矩阵Q, 训练时为Gumbel直通选择权重, [B, s, m]
  at::Tensor scores;
  // 分组覆盖率, 不同分组索引数 / m 的批次平均
  double coverage = 0.0;
};

/*
 * @brief Point Structuring Net
 *
 * 可微的点云下采样与分组模块。得分生成、选择和分组由同一个引擎完成,
 * 变体之间只在输入描述子、得分压缩函数和分组后的修正策略上不同。
 */
class PointStructuringNetImpl : public torch::nn::Module {
 public:
  explicit PointStructuringNetImpl(PSNOptions options_);

  /*
   * @brief 前向传播
   *
   * @param coordinate (Tensor) 输入点云坐标, 形状为[B, m, 3]
   * @param feature    (Tensor) 输入点云特征, 形状为[B, m, d], 可以为未定义张量
   * @param train      (bool)   是否使用Gumbel直通采样
   * @return           (SamplingResult)
   */
  SamplingResult forward(at::Tensor coordinate, at::Tensor feature = {},
                         bool train = false);

  // 得分矩阵Q [B, s, m]
  at::Tensor scores(at::Tensor coordinate);

  void pretty_print(std::ostream &stream) const override;

  PSNOptions options;

 private:
  void check_inputs(const at::Tensor &coordinate,
                    const at::Tensor &feature) const;

  void group_learnable(const at::Tensor &coordinate, const at::Tensor &feature,
                       bool train, SamplingResult &result);
  void group_radius(const at::Tensor &coordinate, SamplingResult &result);
  void group_multi_scale(const at::Tensor &coordinate,
                         const at::Tensor &feature, bool train,
                         SamplingResult &result);

  PointFeatureTransform transform_{nullptr};
  ScoreGenerator score_{nullptr};
  at::Tensor origin_point_;
};
TORCH_MODULE(PointStructuringNet);

}  // namespace psn
