// Copyright (c) Facebook, Inc. and its affiliates.
//
// 本源码遵循MIT协议, 详见根目录下的LICENSE文件。

#include "psn.h"

#include <algorithm>
#include <utility>

#include <c10/util/Logging.h>

#include "ball_query.h"
#include "geometry.h"
#include "group_points.h"
#include "sampling.h"
#include "utils.h"

namespace psn {

const char *variant_name(Variant variant) {
  switch (variant) {
    case Variant::kLearnable:
      return "learnable";
    case Variant::kRadius:
      return "radius";
    case Variant::kMultiScale:
      return "multi_scale";
  }
  return "unknown";
}

PSNOptions PSNOptions::learnable(int64_t num_to_sample, int64_t max_local_num,
                                 std::vector<int64_t> mlp,
                                 bool global_feature) {
  return PSNOptions()
      .variant(Variant::kLearnable)
      .num_to_sample(num_to_sample)
      .max_local_num(max_local_num)
      .mlp(std::move(mlp))
      .global_feature(global_feature);
}

PSNOptions PSNOptions::radius_query(int64_t num_to_sample, double radius,
                                    int64_t max_local_num,
                                    std::vector<int64_t> mlp,
                                    bool global_feature) {
  return PSNOptions()
      .variant(Variant::kRadius)
      .num_to_sample(num_to_sample)
      .radius(radius)
      .max_local_num(max_local_num)
      .mlp(std::move(mlp))
      .global_feature(global_feature);
}

PSNOptions PSNOptions::multi_scale(int64_t num_to_sample,
                                   std::vector<int64_t> msg_n,
                                   std::vector<int64_t> mlp,
                                   bool global_feature) {
  return PSNOptions()
      .variant(Variant::kMultiScale)
      .num_to_sample(num_to_sample)
      .msg_n(std::move(msg_n))
      .mlp(std::move(mlp))
      .global_feature(global_feature);
}

/*
 * @brief 检查配置是否合法
 *
 * 多尺度变体要求msg_n非空且严格升序, 其余变体要求max_local_num为正,
 * 球查询变体还要求radius为正。num_points大于0时提前检查s和n都小于输入点数。
 * 不合法时抛出c10::Error。
 */
void PSNOptions::validate() const {
  TORCH_CHECK(mlp().size() > 1, "The number of MLP layers must greater than 1 !");
  TORCH_CHECK(num_to_sample() > 0, "num_to_sample must be positive, got ",
              num_to_sample());
  TORCH_CHECK(temperature() > 0, "temperature must be positive, got ",
              temperature());

  if (variant() == Variant::kMultiScale) {
    TORCH_CHECK(!msg_n().empty(), "msg_n must not be empty");
    int64_t prev = 0;
    for (int64_t n : msg_n()) {
      TORCH_CHECK(n > prev, "msg_n must be positive and sorted ascending");
      prev = n;
    }
  } else {
    TORCH_CHECK(max_local_num() > 0, "max_local_num must be positive, got ",
                max_local_num());
  }

  if (variant() == Variant::kRadius) {
    TORCH_CHECK(radius() > 0, "radius must be positive, got ", radius());
  }

  if (num_points() > 0) {
    TORCH_CHECK(num_to_sample() < num_points(),
                "The number to sample must less than input points !");
    TORCH_CHECK(group_size() < num_points(),
                "The number of grouped points must less than input points !");
  }
}

int64_t PSNOptions::in_channels() const {
  return variant() == Variant::kLearnable ? 5 : 3;
}

// 每个采样点的邻域大小, 多尺度变体取最大尺度
int64_t PSNOptions::group_size() const {
  if (variant() == Variant::kMultiScale) {
    return msg_n().empty()
               ? 0
               : *std::max_element(msg_n().begin(), msg_n().end());
  }
  return max_local_num();
}

/*
 * @brief Point Structuring Net的构造函数
 *
 * 校验配置, 然后依次注册特征变换层、得分生成层和固定的原点参数。
 * 学习型变体使用sigmoid得分, 启发式变体使用沿槽位的softmax得分。
 *
 * @param options_ 网络配置, 见PSNOptions
 */
PointStructuringNetImpl::PointStructuringNetImpl(PSNOptions options_)
    : options(std::move(options_)) {
  options.validate();

  transform_ = register_module(
      "feature_transform",
      PointFeatureTransform(
          PointFeatureTransformOptions(options.in_channels(), options.mlp())
              .global_feature(options.global_feature())
              .layout(options.layout())));

  score_ = register_module(
      "score_generator",
      ScoreGenerator(
          ScoreGeneratorOptions(transform_->out_channels(),
                                options.num_to_sample())
              .activation(options.variant() == Variant::kLearnable
                              ? ScoreActivation::kSigmoid
                              : ScoreActivation::kSlotSoftmax)
              .layout(options.layout())));

  // 几何描述子的参考原点, 不参与训练
  origin_point_ = register_parameter("origin_point", torch::zeros({1, 3}),
                                     /*requires_grad=*/false);

  VLOG(1) << "PointStructuringNet: variant=" << variant_name(options.variant())
          << " num_to_sample=" << options.num_to_sample()
          << " group_size=" << options.group_size();
}

/*
 * @brief 检查前向输入
 *
 * @param coordinate (Tensor) 点坐标, 形状为[B, m, 3], 要求m大于s和n
 * @param feature    (Tensor) 点特征, 形状为[B, m, d], 可以未定义
 */
void PointStructuringNetImpl::check_inputs(const at::Tensor &coordinate,
                                           const at::Tensor &feature) const {
  CHECK_DIM(coordinate, 3);
  CHECK_IS_FLOATING(coordinate);
  TORCH_CHECK(coordinate.size(2) == 3, "coordinate must have shape [B, m, 3]");

  const int64_t m = coordinate.size(1);
  TORCH_CHECK(options.num_to_sample() < m,
              "The number to sample must less than input points ! (s=",
              options.num_to_sample(), ", m=", m, ")");
  TORCH_CHECK(options.group_size() < m,
              "The number of grouped points must less than input points ! (n=",
              options.group_size(), ", m=", m, ")");

  if (feature.defined()) {
    CHECK_DIM(feature, 3);
    CHECK_IS_FLOATING(feature);
    CHECK_SAME_DEVICE(coordinate, feature);
    TORCH_CHECK(feature.size(0) == coordinate.size(0) &&
                    feature.size(1) == m,
                "feature must have shape [B, m, d] matching coordinate");
  }
}

// 得分矩阵Q [B, s, m], 学习型变体先计算5通道几何描述子
at::Tensor PointStructuringNetImpl::scores(at::Tensor coordinate) {
  at::Tensor x = options.variant() == Variant::kLearnable
                     ? geometry_features(coordinate, origin_point_)
                     : coordinate;
  return score_(transform_(x));
}

/*
 * @brief 采样与分组主函数
 *
 * 先由坐标生成得分矩阵Q, 再按变体完成采样和分组, 最后统计分组覆盖率。
 *
 * @param coordinate (Tensor) 点坐标, 形状为[B, m, 3]
 * @param feature    (Tensor) 点特征, 形状为[B, m, d], 可以未定义
 * @param train      是否为训练模式, 训练时采样点由Gumbel直通采样得到
 * @return           SamplingResult, 各字段是否填充取决于变体与是否给出feature
 */
SamplingResult PointStructuringNetImpl::forward(at::Tensor coordinate,
                                                at::Tensor feature,
                                                bool train) {
  check_inputs(coordinate, feature);

  SamplingResult result;
  result.scores = scores(coordinate);  // [B, s, m]

  switch (options.variant()) {
    case Variant::kLearnable:
      group_learnable(coordinate, feature, train, result);
      break;
    case Variant::kRadius:
      group_radius(coordinate, result);
      break;
    case Variant::kMultiScale:
      group_multi_scale(coordinate, feature, train, result);
      break;
  }

  // 覆盖率只用于监控, 不参与计算
  result.coverage = grouping_coverage(result.grouped_indices, coordinate.size(1));
  VLOG(1) << "Report on unique num: " << result.coverage;
  return result;
}

/*
 * @brief 学习型变体的分组
 *
 * 每个采样槽位取得分最高的n个点作为邻域。推理时采样点即邻域第0个点;
 * 训练时采样点由直通Gumbel-softmax选择矩阵与坐标相乘得到, 并用采样特征
 * 替换邻域特征的第0个位置, 使梯度能流回得分矩阵。
 *
 * @param coordinate (Tensor) 点坐标, 形状为[B, m, 3]
 * @param feature    (Tensor) 点特征, 形状为[B, m, d], 可以未定义
 * @param train      是否为训练模式
 * @param result     输出, 调用前scores已填充
 */
void PointStructuringNetImpl::group_learnable(const at::Tensor &coordinate,
                                              const at::Tensor &feature,
                                              bool train,
                                              SamplingResult &result) {
  // 按得分选取邻域并收集坐标与特征
  result.grouped_indices =
      select_topk(result.scores, options.max_local_num());  // [B, s, n]
  result.grouped_points =
      group_points(coordinate, result.grouped_indices);  // [B, s, n, 3]
  if (feature.defined()) {
    result.grouped_feature =
        group_points(feature, result.grouped_indices);  // [B, s, n, d]
  }

  if (!train) {
    result.sampled_indices = result.grouped_indices.select(2, 0);
    result.sampled_points = result.grouped_points.select(2, 0);
    if (feature.defined()) {
      result.sampled_feature = result.grouped_feature.select(2, 0);
    }
    return;
  }

  // [B, s, m], 每行前向值为one-hot
  at::Tensor weight = relaxed_select(result.scores, options.temperature());
  result.scores = weight;
  result.sampled_indices = weight.argmax(-1);
  result.sampled_points = torch::matmul(weight, coordinate);  // [B, s, 3]
  if (feature.defined()) {
    result.sampled_feature = torch::matmul(weight, feature);  // [B, s, d]
    result.grouped_feature =
        replace_leading_neighbor(result.grouped_feature, result.sampled_feature);
  }
}

/*
 * @brief 球查询变体的分组
 *
 * 采样点为每个槽位得分最高的点, 邻域取得分前n的点, 再用球查询把半径外的
 * 邻居替换为采样点本身。
 *
 * @param coordinate (Tensor) 点坐标, 形状为[B, m, 3]
 * @param result     输出, 调用前scores已填充
 */
void PointStructuringNetImpl::group_radius(const at::Tensor &coordinate,
                                           SamplingResult &result) {
  const int64_t n = options.max_local_num();

  // 按得分降序排列全部点 [B, s, m]
  at::Tensor indices =
      std::get<1>(torch::sort(result.scores, /*dim=*/2, /*descending=*/true));

  result.sampled_indices = indices.select(2, 0);  // [B, s]
  result.grouped_indices = ball_query_refine(
      coordinate, result.sampled_indices, indices.slice(2, 0, n),
      options.radius());  // [B, s, n]

  result.sampled_points = gather_points(coordinate, result.sampled_indices);
  result.grouped_points = gather_points(coordinate, result.grouped_indices);
}

/*
 * @brief 多尺度变体的分组
 *
 * 所有尺度共享一次top-k, 每个尺度取前msg_n[i]个邻居。训练时与学习型变体
 * 相同, 用采样特征替换每个尺度邻域特征的第0个位置。
 *
 * @param coordinate (Tensor) 点坐标, 形状为[B, m, 3]
 * @param feature    (Tensor) 点特征, 形状为[B, m, d], 可以未定义
 * @param train      是否为训练模式
 * @param result     输出, 调用前scores已填充
 */
void PointStructuringNetImpl::group_multi_scale(const at::Tensor &coordinate,
                                                const at::Tensor &feature,
                                                bool train,
                                                SamplingResult &result) {
  const std::vector<int64_t> &msg_n = options.msg_n();

  // 所有尺度共享一次top-k, k为最大尺度
  result.grouped_indices = select_topk(result.scores, options.group_size());
  result.grouped_points = group_points(coordinate, result.grouped_indices);
  result.grouped_points_msg = slice_neighborhoods(result.grouped_points, msg_n);
  if (feature.defined()) {
    result.grouped_feature = group_points(feature, result.grouped_indices);
    result.grouped_feature_msg =
        slice_neighborhoods(result.grouped_feature, msg_n);
  }

  if (!train) {
    // 采样点取最小尺度的第0个邻居, 采样特征取最大尺度的第0个邻居
    result.sampled_indices = result.grouped_indices.select(2, 0);
    result.sampled_points = result.grouped_points_msg.front().select(2, 0);
    if (feature.defined()) {
      result.sampled_feature = result.grouped_feature_msg.back().select(2, 0);
    }
    return;
  }

  // 直通采样, 前向值与argmax一致
  at::Tensor weight = relaxed_select(result.scores, options.temperature());
  result.scores = weight;
  result.sampled_indices = weight.argmax(-1);
  result.sampled_points = torch::matmul(weight, coordinate);
  if (feature.defined()) {
    result.sampled_feature = torch::matmul(weight, feature);
    for (at::Tensor &grouped : result.grouped_feature_msg) {
      grouped = replace_leading_neighbor(grouped, result.sampled_feature);
    }
    result.grouped_feature = result.grouped_feature_msg.back();
  }
}

void PointStructuringNetImpl::pretty_print(std::ostream &stream) const {
  stream << "psn::PointStructuringNet(variant="
         << variant_name(options.variant())
         << ", num_to_sample=" << options.num_to_sample();
  if (options.variant() == Variant::kMultiScale) {
    stream << ", msg_n=[";
    for (size_t i = 0; i < options.msg_n().size(); ++i) {
      stream << (i ? ", " : "") << options.msg_n()[i];
    }
    stream << "]";
  } else {
    stream << ", max_local_num=" << options.max_local_num();
  }
  if (options.variant() == Variant::kRadius) {
    stream << ", radius=" << options.radius();
  }
  stream << ", global_feature=" << std::boolalpha << options.global_feature()
         << ")";
}

}  // namespace psn
