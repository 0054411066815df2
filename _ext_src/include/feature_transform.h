// Copyright (c) Facebook, Inc. and its affiliates.
//
// This source code is licensed under the MIT license found in the
// LICENSE file in the root directory of this source tree.

#pragma once
#include <torch/torch.h>

#include <vector>

namespace psn {

/*
 * @brief 特征变换层的数据排布
 *
 * kChannelLast:  Linear实现, 张量为[B, m, C], BatchNorm前后需要转置。
 * kChannelFirst: 1x1 Conv1d实现, 张量为[B, C, m]。
 * 两者是同一个无偏置网络的两种通道排布, 权重相同时输出一致。
 */
enum class Layout { kChannelLast, kChannelFirst };

// 得分矩阵的压缩函数
enum class ScoreActivation {
  kSigmoid,      // 逐元素sigmoid, 结果在(0, 1)
  kSlotSoftmax,  // 沿采样槽位维度(dim 1)的softmax
};

struct PointFeatureTransformOptions {
  PointFeatureTransformOptions(int64_t in_channels, std::vector<int64_t> mlp);

  // 输入描述子通道数, 学习型为5, 启发式为3
  TORCH_ARG(int64_t, in_channels);
  // 各层输出通道数, 至少两层
  TORCH_ARG(std::vector<int64_t>, mlp);
  // 是否拼接全局最大池化特征
  TORCH_ARG(bool, global_feature) = false;
  TORCH_ARG(Layout, layout) = Layout::kChannelLast;
};

/*
 * @brief 逐点特征变换(Point Feature Transform)
 *
 * 由mlp给出的多层(无偏置投影 -> BatchNorm1d -> ReLU)组成, 所有层在构造时
 * 一次性创建。BatchNorm的统计量在批次和点两个维度上联合计算。
 * global_feature开启时, 在最后一层之后拼接沿点维度的逐通道最大值,
 * 通道数翻倍。
 */
class PointFeatureTransformImpl : public torch::nn::Module {
 public:
  explicit PointFeatureTransformImpl(PointFeatureTransformOptions options_);

  /*
   * @param x (Tensor) 逐点描述子, 形状为[B, m, in_channels]
   * @return  (Tensor) 嵌入, kChannelLast为[B, m, C], kChannelFirst为[B, C, m]
   */
  at::Tensor forward(at::Tensor x);

  // 嵌入通道数C
  int64_t out_channels() const;

  void pretty_print(std::ostream &stream) const override;

  PointFeatureTransformOptions options;

 private:
  std::vector<torch::nn::AnyModule> projections_;
  std::vector<torch::nn::BatchNorm1d> norms_;
};
TORCH_MODULE(PointFeatureTransform);

struct ScoreGeneratorOptions {
  ScoreGeneratorOptions(int64_t in_channels, int64_t num_to_sample);

  TORCH_ARG(int64_t, in_channels);
  TORCH_ARG(int64_t, num_to_sample);
  TORCH_ARG(ScoreActivation, activation) = ScoreActivation::kSigmoid;
  TORCH_ARG(Layout, layout) = Layout::kChannelLast;
};

/*
 * @brief 得分生成(Score Generator)
 *
 * 最后一层投影将嵌入映射到num_to_sample个通道, 得到每个采样槽位对每个输入点
 * 的得分, 再经过activation压缩为得分矩阵Q [B, s, m]。
 */
class ScoreGeneratorImpl : public torch::nn::Module {
 public:
  explicit ScoreGeneratorImpl(ScoreGeneratorOptions options_);

  at::Tensor forward(at::Tensor embedding);

  ScoreGeneratorOptions options;

 private:
  torch::nn::AnyModule projection_;
};
TORCH_MODULE(ScoreGenerator);

// 对原始得分[B, s, m]应用压缩函数
at::Tensor apply_score_activation(at::Tensor x, ScoreActivation activation);

}  // namespace psn
