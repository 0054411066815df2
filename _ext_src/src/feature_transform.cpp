// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "feature_transform.h"
#include "utils.h"

#include <string>
#include <utility>

namespace psn {

namespace {

// 无偏置的逐点投影, kChannelLast为Linear, kChannelFirst为1x1卷积
torch::nn::AnyModule make_projection(int64_t in_channels, int64_t out_channels,
                                     Layout layout) {
  if (layout == Layout::kChannelFirst) {
    return torch::nn::AnyModule(torch::nn::Conv1d(
        torch::nn::Conv1dOptions(in_channels, out_channels, 1).bias(false)));
  }
  return torch::nn::AnyModule(torch::nn::Linear(
      torch::nn::LinearOptions(in_channels, out_channels).bias(false)));
}

}  // namespace

PointFeatureTransformOptions::PointFeatureTransformOptions(
    int64_t in_channels, std::vector<int64_t> mlp)
    : in_channels_(in_channels), mlp_(std::move(mlp)) {}

/*
 * @brief 逐点特征变换层的构造函数
 *
 * 在构造时按mlp一次性建立全部投影层和BatchNorm层, 注册名为
 * mlp_convs_i / mlp_bns_i, 之后不再追加层。
 *
 * @param options_ 输入通道数、各层宽度、是否拼接全局特征及数据排布
 */
PointFeatureTransformImpl::PointFeatureTransformImpl(
    PointFeatureTransformOptions options_)
    : options(std::move(options_)) {
  const std::vector<int64_t> &mlp = options.mlp();
  TORCH_CHECK(mlp.size() > 1, "The number of MLP layers must greater than 1 !");
  TORCH_CHECK(options.in_channels() > 0, "in_channels must be positive");

  projections_.reserve(mlp.size());
  norms_.reserve(mlp.size());

  // 逐层建立投影与BatchNorm, 上一层输出宽度即下一层输入宽度
  int64_t in_channels = options.in_channels();
  for (size_t i = 0; i < mlp.size(); ++i) {
    TORCH_CHECK(mlp[i] > 0, "MLP layer ", i, " must have positive width");
    projections_.push_back(
        make_projection(in_channels, mlp[i], options.layout()));
    norms_.push_back(torch::nn::BatchNorm1d(mlp[i]));
    register_module("mlp_convs_" + std::to_string(i), projections_.back().ptr());
    register_module("mlp_bns_" + std::to_string(i), norms_.back());
    in_channels = mlp[i];
  }
}

/*
 * @brief 逐点特征变换前向计算
 *
 * 每层依次做投影、BatchNorm和ReLU。global_feature为真时,
 * 将所有点上的最大值特征广播后拼接到每个点的特征之后。
 *
 * @param x (Tensor) 输入描述子, 形状为[B, m, C_in]
 * @return  (Tensor) kChannelLast时为[B, m, C_out], kChannelFirst时为[B, C_out, m]
 */
at::Tensor PointFeatureTransformImpl::forward(at::Tensor x) {
  CHECK_DIM(x, 3);
  TORCH_CHECK(x.size(2) == options.in_channels(), "expected ",
              options.in_channels(), " input channels, got ", x.size(2));

  const int64_t m = x.size(1);

  if (options.layout() == Layout::kChannelFirst) {
    x = x.transpose(2, 1);  // [B, C, m]
    // 卷积输出已是通道在前, 直接做BatchNorm
    for (size_t i = 0; i < projections_.size(); ++i) {
      x = torch::relu(norms_[i](projections_[i].forward(x)));
    }
    if (options.global_feature()) {
      // 沿点维度最大池化后广播回每个点
      at::Tensor max_feature = std::get<0>(x.max(2, /*keepdim=*/true));
      x = torch::cat({x, max_feature.expand({-1, -1, m})}, 1);  // [B, 2C, m]
    }
    return x;
  }

  // BatchNorm要求通道在前, 而Linear通道在后,
  // 因此投影后转置到通道在前做BatchNorm, 再转置回来。
  for (size_t i = 0; i < projections_.size(); ++i) {
    x = torch::relu(norms_[i](projections_[i].forward(x).transpose(2, 1)))
            .transpose(2, 1);
  }
  if (options.global_feature()) {
    at::Tensor max_feature = std::get<0>(x.max(1, /*keepdim=*/true));
    x = torch::cat({x, max_feature.expand({-1, m, -1})}, 2);  // [B, m, 2C]
  }
  return x;
}

// 拼接全局特征时输出通道数翻倍
int64_t PointFeatureTransformImpl::out_channels() const {
  const int64_t last = options.mlp().back();
  return options.global_feature() ? last * 2 : last;
}

void PointFeatureTransformImpl::pretty_print(std::ostream &stream) const {
  stream << "psn::PointFeatureTransform(in_channels=" << options.in_channels()
         << ", mlp=[";
  for (size_t i = 0; i < options.mlp().size(); ++i) {
    stream << (i ? ", " : "") << options.mlp()[i];
  }
  stream << "], global_feature=" << std::boolalpha << options.global_feature()
         << ")";
}

ScoreGeneratorOptions::ScoreGeneratorOptions(int64_t in_channels,
                                             int64_t num_to_sample)
    : in_channels_(in_channels), num_to_sample_(num_to_sample) {}

/*
 * @brief 得分生成层的构造函数
 *
 * 建立一个无偏置的逐点投影, 把每个点的嵌入映射为num_to_sample个得分,
 * 注册名为score_conv。
 *
 * @param options_ 嵌入通道数、采样点数、压缩函数及数据排布
 */
ScoreGeneratorImpl::ScoreGeneratorImpl(ScoreGeneratorOptions options_)
    : options(std::move(options_)) {
  TORCH_CHECK(options.num_to_sample() > 0, "num_to_sample must be positive");
  projection_ = make_projection(options.in_channels(), options.num_to_sample(),
                                options.layout());
  register_module("score_conv", projection_.ptr());
}

/*
 * @brief 由逐点嵌入生成得分矩阵Q
 *
 * @param embedding (Tensor) 特征变换层的输出, 排布与options.layout()一致
 * @return          (Tensor) 压缩后的得分矩阵, 形状为[B, s, m]
 */
at::Tensor ScoreGeneratorImpl::forward(at::Tensor embedding) {
  at::Tensor x = projection_.forward(embedding);
  if (options.layout() == Layout::kChannelLast) {
    x = x.transpose(1, 2);  // [B, m, s] -> [B, s, m]
  }
  return apply_score_activation(x, options.activation());
}

/*
 * @brief 得分压缩
 *
 * kSlotSoftmax沿采样槽位维度(dim 1)做softmax, 使每个点在s个槽位上的得分和为1;
 * kSigmoid逐元素压缩到(0, 1)。
 *
 * @param x          (Tensor) 未压缩的得分, 形状为[B, s, m]
 * @param activation 压缩函数
 * @return           (Tensor) 压缩后的得分, 形状为[B, s, m]
 */
at::Tensor apply_score_activation(at::Tensor x, ScoreActivation activation) {
  if (activation == ScoreActivation::kSlotSoftmax) {
    return torch::softmax(x, 1);
  }
  return torch::sigmoid(x);
}

}  // namespace psn
